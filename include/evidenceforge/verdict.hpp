#pragma once
#include <cstdint>
#include <string>
#include "evidenceforge/color.hpp"

namespace ef {

enum class Verdict : uint8_t { Compliant, Violation };

const char* to_string(Verdict v);

// Accepts "compliant"/"violation" in any case.
bool parse_verdict(const std::string& s, Verdict& out);

struct UniformRange { double lo, hi; };

// Sampling ranges of the mock segmentation head.
struct ClassificationProfile {
    UniformRange burnt_soil_pct;
    UniformRange tilled_soil_pct;
    UniformRange vegetation_index;
    UniformRange confidence;
    bool thermal_anomaly;
};

// Thermal field shape. Hotspot count is drawn from [hotspots_min, hotspots_end).
struct ThermalProfile {
    double base_mean, base_stddev;
    double clip_max;
    int    hotspots_min, hotspots_end;
    int    radius_min, radius_end;
    UniformRange amplitude;
};

// Everything that differs between the two verdicts lives here, so callers
// branch once (profile_for) instead of testing the verdict at every step.
struct VerdictProfile {
    Verdict verdict;
    ClassificationProfile classification;
    ThermalProfile thermal;
    const char* status_text;
    Rgb8 status_color;
};

const VerdictProfile& profile_for(Verdict v);

} // namespace ef
