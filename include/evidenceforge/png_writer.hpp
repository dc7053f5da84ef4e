#pragma once
#include <filesystem>
#include <string>
#include "evidenceforge/raster.hpp"

namespace ef {

// 8-bit RGB PNG. Returns false (and fills err) on failure.
bool write_rgb_png(const char* path, const Raster& img, std::string* err=nullptr);

// Atomic variant used for artifacts; throws ArtifactError.
void save_png(const std::filesystem::path& path, const Raster& img);

} // namespace ef
