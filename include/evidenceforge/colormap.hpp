#pragma once
#include "evidenceforge/raster.hpp"
#include "evidenceforge/verdict.hpp"

namespace ef {

// heat_color() applied to every scalar of the field.
Raster heat_layer(const ThermalField& field);

// base*(1-alpha) + overlay*alpha per channel, truncated to 8 bits.
// Throws std::invalid_argument on mismatched sizes.
Raster blend(const Raster& base, const Raster& overlay, double alpha);

// Heat layer of the field blended over base.
Raster blend(const Raster& base, const ThermalField& field, double alpha=0.4);

// Vertical HOT/COOL legend along the right edge.
void draw_scale_bar(Raster& img);

// Status banner for the verdict plus the scale bar.
void annotate_heatmap(Raster& img, Verdict v);

} // namespace ef
