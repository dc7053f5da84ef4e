#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "evidenceforge/color.hpp"

namespace ef {

// Interleaved RGB8, row-major, (0,0) is the top-left pixel.
struct Raster {
    int width=0, height=0;
    std::vector<uint8_t> rgb;

    Raster() = default;
    Raster(int w,int h) : width(w),height(h),rgb(size_t(w)*size_t(h)*3,0) {}
    Raster(int w,int h,Rgb8 fill) : Raster(w,h) {
        for (size_t i=0;i<rgb.size();i+=3){ rgb[i]=fill.r; rgb[i+1]=fill.g; rgb[i+2]=fill.b; }
    }

    bool empty() const { return width<=0 || height<=0; }
    bool contains(int x,int y) const { return x>=0 && y>=0 && x<width && y<height; }
    size_t index(int x,int y) const { return (size_t(y)*size_t(width) + size_t(x))*3; }
    inline uint8_t*       px(int x,int y)       { return &rgb[index(x,y)]; }
    inline const uint8_t* px(int x,int y) const { return &rgb[index(x,y)]; }
    inline void set(int x,int y,Rgb8 c) { uint8_t* p=px(x,y); p[0]=c.r; p[1]=c.g; p[2]=c.b; }

    bool operator==(const Raster& o) const { return width==o.width && height==o.height && rgb==o.rgb; }
    bool operator!=(const Raster& o) const { return !(*this==o); }
};

// Scalar thermal intensities, nominally in [0,1].
struct ThermalField {
    int width=0, height=0;
    std::vector<double> t;

    ThermalField() = default;
    ThermalField(int w,int h) : width(w),height(h),t(size_t(w)*size_t(h),0.0) {}
    inline double&       at(int x,int y)       { return t[size_t(y)*size_t(width) + size_t(x)]; }
    inline const double& at(int x,int y) const { return t[size_t(y)*size_t(width) + size_t(x)]; }

    double max_value() const;
    double min_value() const;
};

// Per-pixel region ids; 0 = background.
struct LabelMap {
    int width=0, height=0;
    std::vector<uint32_t> ids;

    LabelMap() = default;
    LabelMap(int w,int h) : width(w),height(h),ids(size_t(w)*size_t(h),0) {}
    inline uint32_t&       at(int x,int y)       { return ids[size_t(y)*size_t(width) + size_t(x)]; }
    inline const uint32_t& at(int x,int y) const { return ids[size_t(y)*size_t(width) + size_t(x)]; }
};

// Mean of one channel (0=r,1=g,2=b).
double channel_mean(const Raster& img, int channel);

} // namespace ef
