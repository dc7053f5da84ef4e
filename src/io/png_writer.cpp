#include <png.h>

#include <cstdio>
#include <memory>
#include <vector>

#include "evidenceforge/atomic_file.hpp"
#include "evidenceforge/png_writer.hpp"

namespace ef {

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const { if (f) std::fclose(f); }
};

} // namespace

bool write_rgb_png(const char* path, const Raster& img, std::string* err)
{
    auto fail = [&](const char* msg){ if (err) *err = msg; return false; };
    if (img.empty()) return fail("empty raster");

    std::unique_ptr<std::FILE, FileCloser> fp(std::fopen(path, "wb"));
    if (!fp) return fail("cannot open file");

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) return fail("png_create_write_struct failed");
    png_infop info = png_create_info_struct(png);
    if (!info) { png_destroy_write_struct(&png, nullptr); return fail("png_create_info_struct failed"); }

    std::vector<png_bytep> rows(size_t(img.height));
    for (int y=0; y<img.height; ++y)
        rows[size_t(y)] = const_cast<png_bytep>(img.px(0,y));

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return fail("libpng write error");
    }

    png_init_io(png, fp.get());
    png_set_IHDR(png, info, png_uint_32(img.width), png_uint_32(img.height), 8,
                 PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    if (std::fflush(fp.get()) != 0) return fail("flush failed");
    if (std::fclose(fp.release()) != 0) return fail("close failed");
    return true;
}

void save_png(const std::filesystem::path& path, const Raster& img)
{
    io::write_atomic(path, [&](const std::filesystem::path& staging, std::string& err) {
        return write_rgb_png(staging.string().c_str(), img, &err);
    });
}

} // namespace ef
