#include "evidenceforge/geo.hpp"
#include "evidenceforge/hash.hpp"

#include <cmath>
#include <cstdio>

namespace ef {

static std::string fixed4(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    return buf;
}

std::string canonical_string(const GeoCoordinate& c) {
    return fixed4(c.latitude) + "," + fixed4(c.longitude);
}

std::string display_label(const GeoCoordinate& c) {
    return fixed4(std::fabs(c.latitude))  + (c.latitude  >= 0.0 ? "N" : "S") + ", " +
           fixed4(std::fabs(c.longitude)) + (c.longitude >= 0.0 ? "E" : "W");
}

std::string filename_tag(const GeoCoordinate& c) {
    return fixed4(c.latitude) + "_" + fixed4(c.longitude);
}

uint32_t coordinate_seed(const GeoCoordinate& c) {
    return hash_string(canonical_string(c)).leading32();
}

} // namespace ef
