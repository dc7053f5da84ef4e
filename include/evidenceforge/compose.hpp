#pragma once
#include <string>
#include "evidenceforge/color.hpp"
#include "evidenceforge/raster.hpp"

namespace ef {

struct ComparisonLayout {
    int  panel_width = 512, panel_height = 512;
    int  gap = 20;
    int  label_height = 40;
    int  label_scale = 2;
    int  separator_width = 2;
    Rgb8 background = palette::canvas_navy;
    Rgb8 separator  = palette::separator;
};

struct PanelLabel {
    std::string text;
    Rgb8 color;
};

constexpr int kMaxRasterEdge = 65536;

// Mock "diffusion" upscaler: bicubic x scale, then sharpen and detail passes.
// Throws std::invalid_argument for scale < 1 or a result edge above kMaxRasterEdge.
Raster super_resolve(const Raster& src, int scale);

// "SUPER-RESOLVED 2X (MOCK DIFFUSION)" banner.
void annotate_super_resolved(Raster& img, int scale);

// Both inputs resized to the panel size, side by side over a label band,
// separated by a vertical rule centred in the gap.
Raster compose_side_by_side(const Raster& left, const Raster& right,
                            const PanelLabel& left_label, const PanelLabel& right_label,
                            const ComparisonLayout& layout = {});

} // namespace ef
