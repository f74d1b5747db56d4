#include "image_io.hpp"

#include <png.h>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

namespace {

using FilePtr = std::unique_ptr<FILE, int (*)(FILE*)>;

FilePtr open_file(const char* path, const char* mode)
{
    return FilePtr(std::fopen(path, mode), &std::fclose);
}

Status codec_error(const std::string& msg)
{
    return Status(ErrorCode::CodecFailure, msg);
}

}  // namespace

// ---------------------------------------------------------------------------
// PNG import
//
// Every libpng transform needed to land on 8-bit single-channel gray is
// requested up front; after png_read_update_info the row size must equal
// the image width.
// ---------------------------------------------------------------------------
Status load_grayscale_png(const char* path, GrayImage& out)
{
    FilePtr fp = open_file(path, "rb");
    if (!fp)
        return codec_error(std::string("Cannot open file for reading: ") + path);

    png_byte sig[8];
    if (std::fread(sig, 1, sizeof(sig), fp.get()) != sizeof(sig) ||
        png_sig_cmp(sig, 0, sizeof(sig)) != 0)
        return codec_error(std::string("Not a PNG file: ") + path);

    png_structp png = png_create_read_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png)
        return codec_error("png_create_read_struct failed");

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        return codec_error("png_create_info_struct failed");
    }

    // Declared before setjmp so a longjmp out of png_read_row cannot skip it.
    GrayImage img;

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        return codec_error("PNG read error (libpng longjmp)");
    }

    png_init_io(png, fp.get());
    png_set_sig_bytes(png, sizeof(sig));
    png_read_info(png, info);

    const png_uint_32 w          = png_get_image_width(png, info);
    const png_uint_32 h          = png_get_image_height(png, info);
    const int         bit_depth  = png_get_bit_depth(png, info);
    const int         color_type = png_get_color_type(png, info);

    if (bit_depth == 16)
        png_set_strip_16(png);
    if (color_type == PNG_COLOR_TYPE_PALETTE)
        png_set_palette_to_rgb(png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8)
        png_set_expand_gray_1_2_4_to_8(png);
    if ((color_type & PNG_COLOR_MASK_ALPHA) || png_get_valid(png, info, PNG_INFO_tRNS))
        png_set_strip_alpha(png);
    if (color_type & PNG_COLOR_MASK_COLOR)
        png_set_rgb_to_gray_fixed(png, 1, -1, -1);  // default ITU-R 709 weights
    png_read_update_info(png, info);

    if (w == 0 || h == 0 || png_get_rowbytes(png, info) != w) {
        png_destroy_read_struct(&png, &info, nullptr);
        return codec_error("PNG did not decode to 8-bit grayscale");
    }

    img.width  = static_cast<int>(w);
    img.height = static_cast<int>(h);
    img.pixels.assign(static_cast<size_t>(w) * h, 0);
    for (png_uint_32 y = 0; y < h; ++y)
        png_read_row(png, img.pixels.data() + static_cast<size_t>(y) * w, nullptr);

    png_read_end(png, nullptr);
    png_destroy_read_struct(&png, &info, nullptr);
    out = std::move(img);
    return {};
}

// ---------------------------------------------------------------------------
// PNG export (8-bit RGB, rows straight from the heatmap raster)
// ---------------------------------------------------------------------------
Status export_png(const char* path, const RgbBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return codec_error("Cannot encode an empty raster");

    FilePtr fp = open_file(path, "wb");
    if (!fp)
        return codec_error(std::string("Cannot open file for writing: ") + path);

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png)
        return codec_error("png_create_write_struct failed");

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return codec_error("png_create_info_struct failed");
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return codec_error("PNG write error (libpng longjmp)");
    }

    png_init_io(png, fp.get());
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y)
        png_write_row(png, buf.row_ptr(y));

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    if (std::fflush(fp.get()) != 0)
        return codec_error(std::string("Write failed: ") + path);
    return {};
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGB, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
Status export_jxl(const char* path, const RgbBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return codec_error("Cannot encode an empty raster");

    std::unique_ptr<JxlEncoder, void (*)(JxlEncoder*)> enc(
        JxlEncoderCreate(nullptr), &JxlEncoderDestroy);
    if (!enc) return codec_error("JxlEncoderCreate failed");

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                    = static_cast<uint32_t>(buf.width);
    bi.ysize                    = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample          = 8;
    bi.exponent_bits_per_sample = 0;
    bi.alpha_bits               = 0;
    bi.num_color_channels       = 3;
    bi.num_extra_channels       = 0;
    bi.uses_original_profile    = JXL_TRUE;

    if (JxlEncoderSetBasicInfo(enc.get(), &bi) != JXL_ENC_SUCCESS)
        return codec_error("JxlEncoderSetBasicInfo failed");

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc.get(), &color) != JXL_ENC_SUCCESS)
        return codec_error("JxlEncoderSetColorEncoding failed");

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc.get(), nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS)
        return codec_error("JxlEncoderSetFrameLossless failed");

    JxlPixelFormat fmt = {3, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(opts, &fmt, buf.bytes.data(), buf.bytes.size())
            != JXL_ENC_SUCCESS)
        return codec_error("JxlEncoderAddImageFrame failed");
    JxlEncoderCloseInput(enc.get());

    // Collect compressed output
    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc.get(), &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    if (status != JXL_ENC_SUCCESS)
        return codec_error("JxlEncoderProcessOutput failed");

    output.resize(static_cast<size_t>(next_out - output.data()));

    FilePtr fp = open_file(path, "wb");
    if (!fp) return codec_error(std::string("Cannot open file for writing: ") + path);
    if (std::fwrite(output.data(), 1, output.size(), fp.get()) != output.size())
        return codec_error(std::string("Write failed: ") + path);
    return {};
}
#endif  // HAVE_JXL
