#include "evidenceforge/raster.hpp"

#include <algorithm>

namespace ef {

double ThermalField::max_value() const {
    if (t.empty()) return 0.0;
    return *std::max_element(t.begin(), t.end());
}

double ThermalField::min_value() const {
    if (t.empty()) return 0.0;
    return *std::min_element(t.begin(), t.end());
}

double channel_mean(const Raster& img, int channel) {
    if (img.empty()) return 0.0;
    double sum = 0.0;
    for (size_t i = size_t(channel); i < img.rgb.size(); i += 3) sum += img.rgb[i];
    return sum / (double(img.width) * double(img.height));
}

} // namespace ef
