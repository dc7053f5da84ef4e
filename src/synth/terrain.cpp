#include "evidenceforge/terrain.hpp"
#include "evidenceforge/color.hpp"
#include "evidenceforge/draw.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ef {

namespace {

constexpr int kPlotsMin = 4, kPlotsEnd = 8;
constexpr int kPlotMargin = 50;
constexpr int kPlotExtentMin = 40, kPlotExtentEnd = 150;

void fill_channel(Raster& img, int channel, const TerrainChannel& ch, PCG32& rng)
{
    const size_t n = size_t(img.width) * size_t(img.height);
    for (size_t i = 0; i < n; ++i) {
        double v = clip(rng.normal(ch.mean, ch.stddev), double(ch.lo), double(ch.hi));
        img.rgb[i*3 + size_t(channel)] = static_cast<uint8_t>(v);
    }
}

inline void bias(uint8_t& v, int delta, int lo, int hi) {
    v = static_cast<uint8_t>(clip(int(v) + delta, lo, hi));
}

} // namespace

PCG32 SeededRasterGenerator::stream_for(const GeoCoordinate& c)
{
    return PCG32(coordinate_seed(c), kTerrainStream);
}

Raster SeededRasterGenerator::generate(const GeoCoordinate& c, int width, int height) const
{
    PCG32 rng = stream_for(c);
    return generate(rng, width, height);
}

Raster SeededRasterGenerator::generate(PCG32& rng, int width, int height) const
{
    Raster img(width, height);
    fill_channel(img, 0, params_.red,   rng);
    fill_channel(img, 1, params_.green, rng);
    fill_channel(img, 2, params_.blue,  rng);
    return img;
}

const char* to_string(FieldPattern p)
{
    switch (p) {
    case FieldPattern::Crop:   return "crop";
    case FieldPattern::Tilled: return "tilled";
    case FieldPattern::Fallow: return "fallow";
    }
    return "unknown";
}

void apply_plot(Raster& img, const FieldPlot& plot)
{
    for (int y=plot.y0; y<plot.y1; ++y) {
        for (int x=plot.x0; x<plot.x1; ++x) {
            uint8_t* p = img.px(x,y);
            switch (plot.pattern) {
            case FieldPattern::Crop:
                bias(p[1], +40, 0, 200);
                break;
            case FieldPattern::Tilled:
                bias(p[0], +30, 0, 180);
                bias(p[1], -20, 30, 170);
                break;
            case FieldPattern::Fallow:
                bias(p[0], +10, 0, 150);
                bias(p[2], +10, 0, 120);
                break;
            }
        }
    }
}

Raster& apply_field_patterns(Raster& img, PCG32& rng, std::vector<FieldPlot>* plots)
{
    const int count = rng.range(kPlotsMin, kPlotsEnd);
    for (int i=0; i<count; ++i) {
        FieldPlot plot;
        plot.x0 = rng.range(0, img.width  - kPlotMargin);
        plot.y0 = rng.range(0, img.height - kPlotMargin);
        plot.x1 = std::min(plot.x0 + rng.range(kPlotExtentMin, kPlotExtentEnd), img.width);
        plot.y1 = std::min(plot.y0 + rng.range(kPlotExtentMin, kPlotExtentEnd), img.height);
        plot.pattern = static_cast<FieldPattern>(rng.range(0, 3));
        apply_plot(img, plot);
        if (plots) plots->push_back(plot);
    }
    spdlog::debug("field patterns: {} plots on {}x{}", count, img.width, img.height);
    return img;
}

Raster generate_field_tile(const GeoCoordinate& c, int width, int height, std::vector<FieldPlot>* plots)
{
    PCG32 rng = SeededRasterGenerator::stream_for(c);
    Raster img = SeededRasterGenerator().generate(rng, width, height);
    apply_field_patterns(img, rng, plots);
    return img;
}

void annotate_satellite(Raster& img, const GeoCoordinate& c, const std::string& banner)
{
    const int pad = 3;
    draw_label(img, 5, img.height - 5 - text_height() - 2*pad, display_label(c), palette::caption, pad);
    draw_label(img, 5, 5, banner, palette::sentinel_green, pad);
}

} // namespace ef
