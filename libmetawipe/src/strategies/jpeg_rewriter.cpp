#include "../../include/image_library_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(std::string("libjpeg: ") + err->msg);
}

/// Silence libjpeg's stderr warnings.
void jpeg_output_message_quiet(j_common_ptr) {}

struct FileCloser {
    void operator()(FILE *f) const { if (f) std::fclose(f); }
};
using unique_FILE = std::unique_ptr<FILE, FileCloser>;

const char* rewriter_tag() {
    return "jpeg_rewriter";
}

} // namespace

namespace metawipe::image {

void rewrite_jpeg(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  Logger& logger) {
    unique_FILE infile(open_file(input, "rb"));
    if (!infile) {
        throw std::runtime_error("Cannot open JPEG input: " + input.string());
    }
    unique_FILE outfile(open_file(output, "wb"));
    if (!outfile) {
        throw std::runtime_error("Cannot open JPEG output: " + output.string());
    }

    jpeg_decompress_struct srcinfo{};
    jpeg_compress_struct dstinfo{};
    JpegErrorMgr jsrcerr{}, jdsterr{};

    // error handlers must be set before any possible error
    srcinfo.err = jpeg_std_error(&jsrcerr.pub);
    jsrcerr.pub.error_exit = jpeg_error_exit_throw;
    jsrcerr.pub.output_message = jpeg_output_message_quiet;

    dstinfo.err = jpeg_std_error(&jdsterr.pub);
    jdsterr.pub.error_exit = jpeg_error_exit_throw;
    jdsterr.pub.output_message = jpeg_output_message_quiet;

    try {
        jpeg_create_decompress(&srcinfo);
        jpeg_create_compress(&dstinfo);

        jpeg_stdio_src(&srcinfo, infile.get());
        // no jpeg_save_markers: APPn (EXIF, XMP, IPTC, ICC) and COM are discarded

        if (jpeg_read_header(&srcinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }

        logger.debug(std::string("JPEG ") + (srcinfo.progressive_mode ? "progressive" : "baseline") +
                     ": " + input.string(), rewriter_tag());

        jvirt_barray_ptr *coef_arrays = jpeg_read_coefficients(&srcinfo);
        jpeg_copy_critical_parameters(&srcinfo, &dstinfo);

        if (srcinfo.progressive_mode) {
            jpeg_simple_progression(&dstinfo);
        }

        dstinfo.optimize_coding = TRUE;
        jpeg_stdio_dest(&dstinfo, outfile.get());
        jpeg_write_coefficients(&dstinfo, coef_arrays);

        jpeg_finish_compress(&dstinfo);
        jpeg_finish_decompress(&srcinfo);
        jpeg_destroy_compress(&dstinfo);
        jpeg_destroy_decompress(&srcinfo);
    } catch (const std::exception&) {
        jpeg_destroy_compress(&dstinfo);
        jpeg_destroy_decompress(&srcinfo);
        throw;
    }

    infile.reset();
    if (std::fflush(outfile.get()) != 0) {
        throw std::runtime_error("fflush failed for " + output.string());
    }
    if (std::fclose(outfile.release()) != 0) {
        throw std::runtime_error("fclose failed for " + output.string());
    }
}

} // namespace metawipe::image
