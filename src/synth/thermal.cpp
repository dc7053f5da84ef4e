#include "evidenceforge/thermal.hpp"
#include "evidenceforge/color.hpp"
#include "evidenceforge/hash.hpp"
#include "evidenceforge/pcg32.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace ef {

namespace {
constexpr int kHotspotMargin = 50;
}

uint64_t ThermalSeedPolicy::resolve(const GeoCoordinate& c) const
{
    if (mode == Mode::Fixed) return fixed_seed;
    return mix64(uint64_t(coordinate_seed(c)) ^ kThermalStream);
}

std::string ThermalSeedPolicy::describe() const
{
    if (mode == Mode::Fixed) return "fixed:" + std::to_string(fixed_seed);
    return "coordinate";
}

bool parse_thermal_seed_policy(const std::string& s, ThermalSeedPolicy& out)
{
    if (s == "coordinate") { out = ThermalSeedPolicy::per_coordinate(); return true; }
    if (s == "fixed")      { out = ThermalSeedPolicy::fixed(); return true; }
    if (s.rfind("fixed:", 0) == 0 && s.size() > 6) {
        const std::string num = s.substr(6);
        char* end = nullptr;
        unsigned long v = std::strtoul(num.c_str(), &end, 10);
        if (end == nullptr || *end != '\0' || v > 0xffffffffUL) return false;
        out = ThermalSeedPolicy::fixed(static_cast<uint32_t>(v));
        return true;
    }
    return false;
}

void add_hotspot(ThermalField& field, const Hotspot& h)
{
    const double two_r2 = 2.0 * double(h.radius) * double(h.radius);
    #if defined(EF_USE_OMP)
      #pragma omp parallel for schedule(static)
    #endif
    for (int y=0; y<field.height; ++y) {
        const double dy = double(y - h.cy);
        for (int x=0; x<field.width; ++x) {
            const double dx = double(x - h.cx);
            field.at(x,y) += h.amplitude * std::exp(-(dx*dx + dy*dy) / two_r2);
        }
    }
}

ThermalField ThermalFieldSynthesizer::synthesize(int width, int height, Verdict v, uint64_t seed,
                                                 std::vector<Hotspot>* hotspots) const
{
    const ThermalProfile& p = profile_for(v).thermal;
    PCG32 rng(seed, kThermalStream);

    ThermalField field(width, height);
    for (double& t : field.t) t = rng.normal(p.base_mean, p.base_stddev);

    // Margin shrinks on small fields so every centre stays inside.
    const int mx = std::min(kHotspotMargin, width / 4);
    const int my = std::min(kHotspotMargin, height / 4);
    const int count = rng.range(p.hotspots_min, p.hotspots_end);
    for (int i=0; i<count; ++i) {
        Hotspot h;
        h.cx = rng.range(mx, width  - mx);
        h.cy = rng.range(my, height - my);
        h.radius = rng.range(p.radius_min, p.radius_end);
        h.amplitude = rng.uniform(p.amplitude.lo, p.amplitude.hi);
        add_hotspot(field, h);
        if (hotspots) hotspots->push_back(h);
    }

    for (double& t : field.t) t = clip(t, 0.0, p.clip_max);

    spdlog::debug("thermal field {}x{} verdict={} seed={} hotspots={}",
                  width, height, to_string(v), seed, count);
    return field;
}

} // namespace ef
