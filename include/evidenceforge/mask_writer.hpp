#pragma once
#include <fstream>
#include <vector>
#include <cstdint>
#include <string>
#include "evidenceforge/raster.hpp"

namespace ef {

// 8-bit binary PGM: 255 where a region id is set, 0 elsewhere.
inline bool write_mask_pgm(const std::string& path, const LabelMap& g, std::string* err=nullptr) {
    std::ofstream f(path, std::ios::binary);
    if (!f) { if (err) *err = "cannot open " + path; return false; }
    f << "P5\n" << g.width << " " << g.height << "\n255\n";
    std::vector<unsigned char> row(size_t(g.width));
    for (int y=0; y<g.height; ++y) {
        for (int x=0; x<g.width; ++x)
            row[size_t(x)] = g.at(x,y) != 0 ? 255 : 0;
        f.write(reinterpret_cast<const char*>(row.data()), std::streamsize(row.size()));
    }
    f.flush();
    if (!f) { if (err) *err = "short write to " + path; return false; }
    return true;
}

} // namespace ef
