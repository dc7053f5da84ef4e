#pragma once
#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>
#include "evidenceforge/draw.hpp"
#include "evidenceforge/raster.hpp"

namespace ef {

// Default "hot" cut: compliant fields are capped at this value.
constexpr double kHotThreshold = 0.4;

struct HotRegion {
    uint32_t id = 0;
    int x0=0, y0=0, x1=0, y1=0;   // inclusive
    size_t pixels = 0;
    double peak = 0.0;
};

// 4-connected components of pixels strictly above threshold.
// Ids start at 1 in scan order (top-left first).
inline LabelMap label_hot_regions(const ThermalField& f, double threshold = kHotThreshold)
{
    LabelMap labels(f.width, f.height);
    uint32_t next_id = 1;
    std::vector<std::pair<int,int>> stack;
    for (int y=0; y<f.height; ++y) for (int x=0; x<f.width; ++x) {
        if (labels.at(x,y) != 0 || !(f.at(x,y) > threshold)) continue;
        const uint32_t id = next_id++;
        labels.at(x,y) = id;
        stack.emplace_back(x,y);
        while (!stack.empty()) {
            auto [cx, cy] = stack.back(); stack.pop_back();
            const int nx[4] = {cx-1, cx+1, cx,   cx  };
            const int ny[4] = {cy,   cy,   cy-1, cy+1};
            for (int k=0; k<4; ++k) {
                if (nx[k]<0 || ny[k]<0 || nx[k]>=f.width || ny[k]>=f.height) continue;
                if (labels.at(nx[k],ny[k]) != 0 || !(f.at(nx[k],ny[k]) > threshold)) continue;
                labels.at(nx[k],ny[k]) = id;
                stack.emplace_back(nx[k],ny[k]);
            }
        }
    }
    return labels;
}

// Tight boxes, pixel counts and peaks per label, ordered by id.
inline std::vector<HotRegion> regions_from_labels(const LabelMap& g, const ThermalField& f)
{
    std::vector<HotRegion> acc;
    for (int y=0; y<g.height; ++y) for (int x=0; x<g.width; ++x) {
        const uint32_t id = g.at(x,y);
        if (id==0) continue;
        if (acc.size() < id) acc.resize(id);
        HotRegion& b = acc[id-1];
        if (b.pixels == 0) {
            b.id = id; b.x0=b.x1=x; b.y0=b.y1=y; b.peak = f.at(x,y);
        } else {
            b.x0 = std::min(b.x0, x); b.y0 = std::min(b.y0, y);
            b.x1 = std::max(b.x1, x); b.y1 = std::max(b.y1, y);
            b.peak = std::max(b.peak, f.at(x,y));
        }
        ++b.pixels;
    }
    return acc;
}

inline std::vector<HotRegion> locate_hotspots(const ThermalField& f, double threshold = kHotThreshold)
{
    return regions_from_labels(label_hot_regions(f, threshold), f);
}

inline void draw_regions(Raster& img, const std::vector<HotRegion>& regions, Rgb8 c = palette::box_yellow)
{
    for (const auto& r : regions) draw_rect(img, r.x0, r.y0, r.x1, r.y1, c);
}

} // namespace ef
