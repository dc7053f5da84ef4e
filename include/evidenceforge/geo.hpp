#pragma once
#include <cstdint>
#include <string>

namespace ef {

struct GeoCoordinate {
    double latitude  = 0.0;
    double longitude = 0.0;

    bool is_valid() const {
        return latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }
};

// "28.6139,77.2090" -- fixed 4-decimal precision, the seed source.
std::string canonical_string(const GeoCoordinate& c);

// "28.6139N, 77.2090E"
std::string display_label(const GeoCoordinate& c);

// "28.6139_77.2090", for artifact file names.
std::string filename_tag(const GeoCoordinate& c);

// Leading 32 bits of the FNV-1a digest of canonical_string().
uint32_t coordinate_seed(const GeoCoordinate& c);

} // namespace ef
