#include "evidenceforge/colormap.hpp"
#include "evidenceforge/color.hpp"
#include "evidenceforge/draw.hpp"

#include <stdexcept>
#include <string>

namespace ef {

Raster heat_layer(const ThermalField& field)
{
    Raster out(field.width, field.height);
    #if defined(EF_USE_OMP)
      #pragma omp parallel for schedule(static)
    #endif
    for (int y=0; y<field.height; ++y)
        for (int x=0; x<field.width; ++x)
            out.set(x, y, heat_color(field.at(x,y)));
    return out;
}

Raster blend(const Raster& base, const Raster& overlay, double alpha)
{
    if (base.width != overlay.width || base.height != overlay.height)
        throw std::invalid_argument("blend: size mismatch " +
            std::to_string(base.width) + "x" + std::to_string(base.height) + " vs " +
            std::to_string(overlay.width) + "x" + std::to_string(overlay.height));

    Raster out(base.width, base.height);
    const long long n = (long long)base.rgb.size();
    #if defined(EF_USE_OMP)
      #pragma omp parallel for schedule(static)
    #endif
    for (long long i=0; i<n; ++i) {
        const double a = base.rgb[size_t(i)], b = overlay.rgb[size_t(i)];
        out.rgb[size_t(i)] = to_u8(a + alpha * (b - a));
    }
    return out;
}

Raster blend(const Raster& base, const ThermalField& field, double alpha)
{
    return blend(base, heat_layer(field), alpha);
}

void draw_scale_bar(Raster& img)
{
    const int w = img.width, h = img.height;
    const int span = h - 80;
    if (w < 40 || span <= 0) return;

    fill_rect(img, w-35, 40, w-10, h-40, palette::black);
    // Hot end at the top, next to the HOT caption.
    for (int i=0; i<span; ++i) {
        const double t = 1.0 - double(i) / double(span);
        draw_hline(img, w-32, w-13, 43 + i, heat_color(t));
    }
    draw_text(img, w-33, 30, "HOT", palette::alert_red);
    draw_text(img, w-38, h-36, "COOL", palette::cool_blue);
}

void annotate_heatmap(Raster& img, Verdict v)
{
    const VerdictProfile& p = profile_for(v);
    draw_label(img, 5, 5, p.status_text, p.status_color, 4);
    draw_scale_bar(img);
}

} // namespace ef
