#include "../../include/image_library_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/**
 * @brief libpng error handler that throws a C++ exception.
 * @param msg The error message from libpng.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    throw std::runtime_error(std::string("libpng: ") + msg);
}

void png_warning_fn(png_structp png, const png_const_charp msg) {
    if (auto *logger = static_cast<metawipe::Logger *>(png_get_error_ptr(png))) {
        logger->debug(std::string("libpng: ") + msg, "png_rewriter");
    }
}

struct FileCloser {
    void operator()(FILE *f) const { if (f) std::fclose(f); }
};
using unique_FILE = std::unique_ptr<FILE, FileCloser>;

/**
 * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

/**
 * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
};

} // namespace

namespace metawipe::image {

void rewrite_png(const std::filesystem::path& input,
                 const std::filesystem::path& output,
                 Logger& logger) {
    unique_FILE fp_in(open_file(input, "rb"));
    if (!fp_in) {
        throw std::runtime_error("Cannot open PNG input: " + input.string());
    }

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, &logger, png_error_fn, png_warning_fn);
    if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw std::runtime_error("png_create_info_struct failed");

    // ancillary chunks are never needed, so don't even keep unknown ones
    png_set_keep_unknown_chunks(rd.png, PNG_HANDLE_CHUNK_NEVER, nullptr, 0);

    png_init_io(rd.png, fp_in.get());
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0, interlace = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, &interlace, nullptr, nullptr);

    // deinterlace on read, output is written non-interlaced
    png_set_interlace_handling(rd.png);
    png_read_update_info(rd.png, rd.info);

    const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    std::vector<unsigned char> image(rowbytes * height);
    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = image.data() + y * rowbytes;
    }
    png_read_image(rd.png, rows.data());
    png_read_end(rd.png, nullptr);

    png_colorp palette = nullptr;
    int num_palette = 0;
    const bool has_plte = png_get_PLTE(rd.png, rd.info, &palette, &num_palette) != 0;

    png_bytep trans_alpha = nullptr;
    int num_trans = 0;
    png_color_16p trans_color = nullptr;
    const bool has_trns = png_get_tRNS(rd.png, rd.info, &trans_alpha, &num_trans, &trans_color) != 0;

    fp_in.reset();

    unique_FILE fp_out(open_file(output, "wb"));
    if (!fp_out) {
        throw std::runtime_error("Cannot open PNG output: " + output.string());
    }

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &logger, png_error_fn, png_warning_fn);
    if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw std::runtime_error("png_create_info_struct failed (write)");

    png_init_io(wr.png, fp_out.get());
    png_set_IHDR(wr.png, wr.info, width, height, bit_depth, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    if (has_plte) {
        png_set_PLTE(wr.png, wr.info, palette, num_palette);
    }
    if (has_trns) {
        png_set_tRNS(wr.png, wr.info, trans_alpha, num_trans, trans_color);
    }

    png_write_info(wr.png, wr.info);
    png_write_image(wr.png, rows.data());
    png_write_end(wr.png, nullptr);

    logger.debug("PNG rewritten: " + std::to_string(width) + "x" + std::to_string(height) +
                 (interlace != PNG_INTERLACE_NONE ? " (deinterlaced)" : ""), "png_rewriter");

    if (std::fclose(fp_out.release()) != 0) {
        throw std::runtime_error("fclose failed for " + output.string());
    }
}

} // namespace metawipe::image
