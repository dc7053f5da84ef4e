#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "evidenceforge/geo.hpp"
#include "evidenceforge/raster.hpp"
#include "evidenceforge/verdict.hpp"

namespace ef {

// Where the thermal generator's seed comes from.
//   Fixed         -- one constant for every render (42 reproduces the legacy
//                    demo visuals: all violation heatmaps share one geometry).
//   PerCoordinate -- derived from the coordinate seed, so each field gets its
//                    own hotspot layout but repeats exactly for that field.
struct ThermalSeedPolicy {
    enum class Mode { Fixed, PerCoordinate };

    Mode     mode = Mode::PerCoordinate;
    uint32_t fixed_seed = 42;

    static ThermalSeedPolicy fixed(uint32_t seed = 42) { return {Mode::Fixed, seed}; }
    static ThermalSeedPolicy per_coordinate() { return {Mode::PerCoordinate, 0}; }

    uint64_t resolve(const GeoCoordinate& c) const;
    // "fixed:42" or "coordinate"
    std::string describe() const;
};

// Parses the describe() forms; "fixed" alone means fixed:42.
bool parse_thermal_seed_policy(const std::string& s, ThermalSeedPolicy& out);

struct Hotspot {
    int cx=0, cy=0, radius=0;
    double amplitude=0.0;
};

class ThermalFieldSynthesizer {
public:
    // Compliant: N(0.2,0.05) clipped to [0,0.4].
    // Violation: N(0.15,0.05) plus 2..4 Gaussian bumps, clipped to [0,1].
    ThermalField synthesize(int width, int height, Verdict v, uint64_t seed,
                            std::vector<Hotspot>* hotspots=nullptr) const;
};

// Adds amp * exp(-d^2 / (2 r^2)) around (cx,cy) to every pixel.
void add_hotspot(ThermalField& field, const Hotspot& h);

} // namespace ef
