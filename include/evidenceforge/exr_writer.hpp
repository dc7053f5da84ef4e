#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "evidenceforge/raster.hpp"

namespace ef {
bool write_float_exr(const char* path, int w, int h, const std::vector<float>& img,
                     const char* channel="Y", std::string* err=nullptr);

// Raw thermal intensities as a single float channel "T"; atomic, throws ArtifactError.
void save_thermal_exr(const std::filesystem::path& path, const ThermalField& field);
}
