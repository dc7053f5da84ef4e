#include "evidenceforge/compose.hpp"
#include "evidenceforge/draw.hpp"
#include "evidenceforge/resample.hpp"

#include <stdexcept>
#include <string>

namespace ef {

Raster super_resolve(const Raster& src, int scale)
{
    if (scale < 1) throw std::invalid_argument("super_resolve: scale must be >= 1, got " + std::to_string(scale));
    if (src.empty()) throw std::invalid_argument("super_resolve: empty raster");
    if ((long long)src.width * scale > kMaxRasterEdge || (long long)src.height * scale > kMaxRasterEdge)
        throw std::invalid_argument("super_resolve: result exceeds " + std::to_string(kMaxRasterEdge) + " px per edge");

    Raster up = resize_bicubic(src, src.width * scale, src.height * scale);
    return enhance_detail(sharpen(up));
}

void annotate_super_resolved(Raster& img, int scale)
{
    draw_label(img, 5, 5, "SUPER-RESOLVED " + std::to_string(scale) + "X (MOCK DIFFUSION)", palette::violet, 4);
}

Raster compose_side_by_side(const Raster& left, const Raster& right,
                            const PanelLabel& left_label, const PanelLabel& right_label,
                            const ComparisonLayout& layout)
{
    if (left.empty() || right.empty())
        throw std::invalid_argument("compose_side_by_side: empty panel");

    const int pw = layout.panel_width, ph = layout.panel_height;
    const int canvas_w = pw * 2 + layout.gap;
    const int canvas_h = ph + layout.label_height;
    Raster canvas(canvas_w, canvas_h, layout.background);

    const int right_x = pw + layout.gap;
    paste(canvas, resize_bicubic(left,  pw, ph), 0,       layout.label_height);
    paste(canvas, resize_bicubic(right, pw, ph), right_x, layout.label_height);

    const int ty = (layout.label_height - text_height(layout.label_scale)) / 2;
    draw_text(canvas, (pw - text_width(left_label.text,  layout.label_scale)) / 2,
              ty, left_label.text, left_label.color, layout.label_scale);
    draw_text(canvas, right_x + (pw - text_width(right_label.text, layout.label_scale)) / 2,
              ty, right_label.text, right_label.color, layout.label_scale);

    draw_vline(canvas, pw + layout.gap/2, layout.label_height, canvas_h - 1,
               layout.separator, layout.separator_width);
    return canvas;
}

} // namespace ef
