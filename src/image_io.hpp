#pragma once

#include "heatmap.hpp"
#include "status.hpp"

#include <cstdint>
#include <vector>

// Decoded source image: one grayscale byte per pixel, row-major.
struct GrayImage {
    std::vector<uint8_t> pixels;
    int width  = 0;
    int height = 0;
};

// Decodes any PNG (palette, gray, RGB, with or without alpha, 8/16-bit) to
// 8-bit grayscale using libpng's own transforms. CodecFailure on error.
Status load_grayscale_png(const char* path, GrayImage& out);

Status export_png(const char* path, const RgbBuffer& buf);

#ifdef HAVE_JXL
Status export_jxl(const char* path, const RgbBuffer& buf);
#endif

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}
