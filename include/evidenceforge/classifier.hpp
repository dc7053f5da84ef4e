#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "evidenceforge/geo.hpp"
#include "evidenceforge/verdict.hpp"

namespace ef {

struct ClassificationResult {
    Verdict verdict = Verdict::Compliant;
    double  confidence = 0.0;          // [0,1], 2 decimals
    double  burnt_soil_pct = 0.0;      // [0,100], 1 decimal
    double  tilled_soil_pct = 0.0;     // [0,100], 1 decimal
    double  vegetation_index = 0.0;    // NDVI-like, [-1,1], 2 decimals
    bool    thermal_anomaly = false;

    std::string   image_hash;          // leading 16 hex digits of the content digest
    std::string   model_version;
    GeoCoordinate gps;
    std::string   timestamp;           // ISO-8601 UTC, time of the call
};

// Mock soil-segmentation classifier.
//
// The photo's content hash seeds the generator, so identical bytes always
// give identical numbers. The verdict comes from the filename alone: any of
// "burn", "fire", "smoke", "stubble" (case-insensitive) means VIOLATION.
// Demo triggers are filename based; the bytes never change the verdict.
//
// Stateless value type; any caller may hold its own instance.
class PhotoComplianceClassifier {
public:
    static constexpr const char* kModelVersion = "resnet50-unet-v1.0-mock";

    PhotoComplianceClassifier();

    ClassificationResult classify(const void* data, size_t size, const std::string& filename,
                                  const GeoCoordinate& gps = {}) const;
    ClassificationResult classify(const std::vector<uint8_t>& photo, const std::string& filename,
                                  const GeoCoordinate& gps = {}) const;

    static const std::array<const char*, 4>& trigger_keywords();
    static bool is_violation_filename(const std::string& filename);
};

// Rounds half away from zero to the given number of decimals.
double round_to(double v, int decimals);

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_timestamp();

} // namespace ef
