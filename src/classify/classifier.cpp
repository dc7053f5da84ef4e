#include "evidenceforge/classifier.hpp"
#include "evidenceforge/hash.hpp"
#include "evidenceforge/pcg32.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>

namespace ef {

double round_to(double v, int decimals)
{
    const double scale = std::pow(10.0, decimals);
    return std::round(v * scale) / scale;
}

std::string utc_timestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

PhotoComplianceClassifier::PhotoComplianceClassifier()
{
    spdlog::debug("photo classifier ready (model {})", kModelVersion);
}

const std::array<const char*, 4>& PhotoComplianceClassifier::trigger_keywords()
{
    static const std::array<const char*, 4> kw = {"burn", "fire", "smoke", "stubble"};
    return kw;
}

bool PhotoComplianceClassifier::is_violation_filename(const std::string& filename)
{
    std::string lower = filename;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c){ return (char)std::tolower(c); });
    for (const char* kw : trigger_keywords())
        if (lower.find(kw) != std::string::npos) return true;
    return false;
}

ClassificationResult PhotoComplianceClassifier::classify(const void* data, size_t size,
                                                         const std::string& filename,
                                                         const GeoCoordinate& gps) const
{
    const Digest64 digest = hash_bytes(data, size);
    PCG32 rng(digest.leading32(), kPhotoStream);

    const Verdict verdict = is_violation_filename(filename) ? Verdict::Violation : Verdict::Compliant;
    const ClassificationProfile& p = profile_for(verdict).classification;

    ClassificationResult r;
    r.verdict          = verdict;
    r.burnt_soil_pct   = round_to(rng.uniform(p.burnt_soil_pct.lo,   p.burnt_soil_pct.hi),   1);
    r.tilled_soil_pct  = round_to(rng.uniform(p.tilled_soil_pct.lo,  p.tilled_soil_pct.hi),  1);
    r.vegetation_index = round_to(rng.uniform(p.vegetation_index.lo, p.vegetation_index.hi), 2);
    r.thermal_anomaly  = p.thermal_anomaly;
    r.confidence       = round_to(rng.uniform(p.confidence.lo,       p.confidence.hi),       2);
    r.image_hash       = digest.hex();
    r.model_version    = kModelVersion;
    r.gps              = gps;
    r.timestamp        = utc_timestamp();

    spdlog::info("classified '{}' ({} bytes, hash {}): {} conf={:.2f}",
                 filename, size, r.image_hash, to_string(verdict), r.confidence);
    return r;
}

ClassificationResult PhotoComplianceClassifier::classify(const std::vector<uint8_t>& photo,
                                                         const std::string& filename,
                                                         const GeoCoordinate& gps) const
{
    return classify(photo.data(), photo.size(), filename, gps);
}

} // namespace ef
