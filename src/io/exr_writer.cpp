// Force TinyEXR to use system zlib (not miniz)
#define TINYEXR_USE_MINIZ 0
#define TINYEXR_USE_ZLIB  1

#define TINYEXR_IMPLEMENTATION
#include <zlib.h>        // ensure zlib types like uLong, Bytef are visible
#include <tinyexr.h>

#include <cstdlib>
#include <cstring>
#include "evidenceforge/atomic_file.hpp"
#include "evidenceforge/exr_writer.hpp"


namespace ef {

bool write_float_exr(const char* path, int w, int h, const std::vector<float>& img,
                     const char* channel, std::string* err_out){
    if (w <= 0 || h <= 0 || img.size() != size_t(w)*size_t(h)){
        if (err_out) *err_out = "image size does not match dimensions";
        return false;
    }

    EXRHeader header; InitEXRHeader(&header);
    EXRImage image;  InitEXRImage(&image);
    image.num_channels = 1;

    float* ptr = const_cast<float*>(img.data());
    image.images = reinterpret_cast<unsigned char**>(&ptr);
    image.width = w; image.height = h;

    header.num_channels = 1;
    header.compression_type = TINYEXR_COMPRESSIONTYPE_ZIP;
    header.channels = (EXRChannelInfo*)malloc(sizeof(EXRChannelInfo));
    std::strncpy(header.channels[0].name, channel, 255); header.channels[0].name[255]='\0';

    header.pixel_types = (int*)malloc(sizeof(int));
    header.requested_pixel_types = (int*)malloc(sizeof(int));
    header.pixel_types[0]=TINYEXR_PIXELTYPE_FLOAT;
    header.requested_pixel_types[0]=TINYEXR_PIXELTYPE_FLOAT;

    const char* err = nullptr;
    int ret = SaveEXRImageToFile(&image, &header, path, &err);
    free(header.channels); free(header.pixel_types); free(header.requested_pixel_types);
    if (ret != TINYEXR_SUCCESS){
        if (err_out) *err_out = err ? err : "SaveEXRImageToFile failed";
        if (err){ FreeEXRErrorMessage(err); }
        return false;
    }
    return true;
}

void save_thermal_exr(const std::filesystem::path& path, const ThermalField& field){
    std::vector<float> T(field.t.size());
    for (size_t i=0;i<T.size();++i) T[i] = (float)field.t[i];
    io::write_atomic(path, [&](const std::filesystem::path& staging, std::string& err){
        return write_float_exr(staging.string().c_str(), field.width, field.height, T, "T", &err);
    });
}

} // namespace ef
