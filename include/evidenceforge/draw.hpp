#pragma once
#include <string>
#include "evidenceforge/raster.hpp"

namespace ef {

// All drawing clips to the raster bounds; coordinates are inclusive.

// 1px rectangle outline.
void draw_rect(Raster& img, int x0, int y0, int x1, int y1, Rgb8 c);

// Solid rectangle.
void fill_rect(Raster& img, int x0, int y0, int x1, int y1, Rgb8 c);

// Axis-aligned line of the given thickness (horizontal or vertical only).
void draw_hline(Raster& img, int x0, int x1, int y, Rgb8 c, int thickness=1);
void draw_vline(Raster& img, int x, int y0, int y1, Rgb8 c, int thickness=1);

// 5x7 bitmap text, top-left anchored; scale multiplies each font pixel.
void draw_text(Raster& img, int x, int y, const std::string& text, Rgb8 c, int scale=1);
int  text_width(const std::string& text, int scale=1);
int  text_height(int scale=1);

// Caption on a black plate, as used for the status banners.
void draw_label(Raster& img, int x, int y, const std::string& text, Rgb8 c, int pad=3);

// Copies src into dst with its top-left corner at (x,y).
void paste(Raster& dst, const Raster& src, int x, int y);

} // namespace ef
