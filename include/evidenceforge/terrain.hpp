#pragma once
#include <string>
#include <vector>
#include "evidenceforge/geo.hpp"
#include "evidenceforge/pcg32.hpp"
#include "evidenceforge/raster.hpp"

namespace ef {

// Gaussian channel model: N(mean, stddev) clipped to [lo, hi].
struct TerrainChannel {
    double mean, stddev;
    int lo, hi;
};

struct TerrainParams {
    TerrainChannel red   { 80.0, 20.0, 30, 130};
    TerrainChannel green {110.0, 25.0, 50, 170};
    TerrainChannel blue  { 60.0, 15.0, 20, 100};
};

// Base agricultural terrain from a coordinate-derived seed.
class SeededRasterGenerator {
public:
    SeededRasterGenerator() = default;
    explicit SeededRasterGenerator(const TerrainParams& p) : params_(p) {}

    // Generator seeded from coordinate_seed(c); the same stream must be
    // handed on to apply_field_patterns() for reproducible tiles.
    static PCG32 stream_for(const GeoCoordinate& c);

    Raster generate(const GeoCoordinate& c, int width=512, int height=512) const;
    // Channel planes are drawn in order: all red, all green, all blue.
    Raster generate(PCG32& rng, int width, int height) const;

    const TerrainParams& params() const { return params_; }

private:
    TerrainParams params_;
};

enum class FieldPattern { Crop, Tilled, Fallow };

const char* to_string(FieldPattern p);

// Plot rectangle, half-open: [x0,x1) x [y0,y1).
struct FieldPlot {
    int x0=0, y0=0, x1=0, y1=0;
    FieldPattern pattern = FieldPattern::Crop;
};

// Draws 4..7 rectangular plots and applies the per-class channel bias.
// Later plots overwrite earlier ones. Consumes rng after the base raster.
Raster& apply_field_patterns(Raster& img, PCG32& rng, std::vector<FieldPlot>* plots=nullptr);

// Biases one plot's pixels in place.
void apply_plot(Raster& img, const FieldPlot& plot);

// generate() + apply_field_patterns() on one stream.
Raster generate_field_tile(const GeoCoordinate& c, int width=512, int height=512,
                           std::vector<FieldPlot>* plots=nullptr);

// Coordinate caption (bottom-left) and source banner (top-left).
void annotate_satellite(Raster& img, const GeoCoordinate& c,
                        const std::string& banner = "SENTINEL-2 L2A (MOCK)");

} // namespace ef
