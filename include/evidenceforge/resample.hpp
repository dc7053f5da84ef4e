#pragma once
#include <array>
#include "evidenceforge/raster.hpp"

namespace ef {

// OpenCV INTER_CUBIC resize. Same size returns a copy.
Raster resize_bicubic(const Raster& src, int width, int height);

// Gaussian with sigma = radius, replicated edges. radius <= 0 copies.
Raster gaussian_blur(const Raster& src, double radius);

// 3x3 convolution, result = sum/divisor + offset, saturated to 8 bits.
// Edges replicate. Throws std::invalid_argument for divisor 0.
Raster filter3x3(const Raster& src, const std::array<int,9>& kernel, int divisor, int offset=0);

// The classic SHARPEN and DETAIL enhancement kernels.
Raster sharpen(const Raster& src);
Raster enhance_detail(const Raster& src);

} // namespace ef
