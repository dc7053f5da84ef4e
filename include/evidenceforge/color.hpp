#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace ef {

struct Rgb8 {
    uint8_t r = 0, g = 0, b = 0;
};

// --- Helpers ---
inline double saturate(double x) { return std::min(1.0, std::max(0.0, x)); }
inline double clip(double x, double lo, double hi) { return std::min(hi, std::max(lo, x)); }
inline int    clip(int x, int lo, int hi) { return std::min(hi, std::max(lo, x)); }

// Truncating 8-bit pack, values already in [0,255].
inline uint8_t to_u8(double x) { return static_cast<uint8_t>(clip(x, 0.0, 255.0)); }

// Thermal transfer function: blue (cool) -> green -> yellow -> red (hot).
inline double heat_red(double t)   { return saturate(3.0*t - 1.0); }
inline double heat_green(double t) { return saturate(1.0 - std::fabs(3.0*t - 1.5) * 2.0); }
inline double heat_blue(double t)  { return saturate(1.0 - 3.0*t); }

inline Rgb8 heat_color(double t) {
    return { uint8_t(heat_red(t) * 255.0), uint8_t(heat_green(t) * 255.0), uint8_t(heat_blue(t) * 255.0) };
}

// Named colors used by the annotations.
namespace palette {
constexpr Rgb8 black         {  0,   0,   0};
constexpr Rgb8 caption       {200, 200, 200};
constexpr Rgb8 sentinel_green{100, 200, 100};
constexpr Rgb8 ok_green      {100, 255, 100};
constexpr Rgb8 alert_red     {255,  80,  80};
constexpr Rgb8 cool_blue     { 80,  80, 255};
constexpr Rgb8 amber         {255, 200,  80};
constexpr Rgb8 violet        {200, 100, 255};
constexpr Rgb8 box_yellow    {255, 255,   0};
constexpr Rgb8 canvas_navy   { 10,  14,  23};
constexpr Rgb8 separator     { 56, 189, 108};
} // namespace palette

} // namespace ef
