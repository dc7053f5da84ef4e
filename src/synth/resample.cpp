#include "evidenceforge/resample.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <stdexcept>

namespace ef {

namespace {

// Views share the raster's pixels; no copy.
cv::Mat view(Raster& img) { return cv::Mat(img.height, img.width, CV_8UC3, img.rgb.data()); }
cv::Mat view(const Raster& img) { return view(const_cast<Raster&>(img)); }

} // namespace

Raster resize_bicubic(const Raster& src, int width, int height)
{
    if (src.empty() || width <= 0 || height <= 0)
        throw std::invalid_argument("resize_bicubic: empty source or target");
    if (src.width == width && src.height == height) return src;

    Raster out(width, height);
    cv::Mat dst = view(out);
    cv::resize(view(src), dst, dst.size(), 0, 0, cv::INTER_CUBIC);
    return out;
}

Raster gaussian_blur(const Raster& src, double radius)
{
    if (radius <= 0.0 || src.empty()) return src;

    Raster out(src.width, src.height);
    cv::Mat dst = view(out);
    cv::GaussianBlur(view(src), dst, cv::Size(), radius, radius, cv::BORDER_REPLICATE);
    return out;
}

Raster filter3x3(const Raster& src, const std::array<int,9>& kernel, int divisor, int offset)
{
    if (divisor == 0) throw std::invalid_argument("filter3x3: zero divisor");
    if (src.empty()) return src;

    cv::Mat k(3, 3, CV_32F);
    for (int i=0; i<9; ++i) k.at<float>(i/3, i%3) = float(kernel[size_t(i)]) / float(divisor);

    Raster out(src.width, src.height);
    cv::Mat dst = view(out);
    cv::filter2D(view(src), dst, CV_8U, k, cv::Point(-1,-1), double(offset), cv::BORDER_REPLICATE);
    return out;
}

Raster sharpen(const Raster& src)
{
    return filter3x3(src, {-2,-2,-2, -2,32,-2, -2,-2,-2}, 16);
}

Raster enhance_detail(const Raster& src)
{
    return filter3x3(src, {0,-1,0, -1,10,-1, 0,-1,0}, 6);
}

} // namespace ef
