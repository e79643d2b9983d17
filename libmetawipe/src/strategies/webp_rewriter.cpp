#include "../../include/image_library_strategy.hpp"
#include "../../include/logger.hpp"
#include <webp/mux.h>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* rewriter_tag() {
    return "webp_rewriter";
}

/// RAII owner of a WebPMux handle.
struct MuxDeleter {
    void operator()(WebPMux *mux) const { if (mux) WebPMuxDelete(mux); }
};
using unique_mux = std::unique_ptr<WebPMux, MuxDeleter>;

} // namespace

namespace metawipe::image {

void rewrite_webp(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  Logger& logger) {
    std::ifstream file(input, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open WebP input: " + input.string());
    }
    const std::vector<uint8_t> input_data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (input_data.empty()) {
        throw std::runtime_error("Empty WebP input: " + input.string());
    }

    const WebPData input_webp{input_data.data(), input_data.size()};
    const unique_mux mux(WebPMuxCreate(&input_webp, 1));
    if (!mux) {
        throw std::runtime_error("WebPMuxCreate failed (not a WebP file?)");
    }

    for (const char *fourcc : {"EXIF", "XMP ", "ICCP"}) {
        const WebPMuxError err = WebPMuxDeleteChunk(mux.get(), fourcc);
        if (err == WEBP_MUX_OK) {
            logger.debug(std::string("Dropped WebP chunk ") + fourcc, rewriter_tag());
        } else if (err != WEBP_MUX_NOT_FOUND) {
            throw std::runtime_error(std::string("WebPMuxDeleteChunk failed for ") + fourcc);
        }
    }

    WebPData final_data;
    WebPDataInit(&final_data);
    if (WebPMuxAssemble(mux.get(), &final_data) != WEBP_MUX_OK) {
        throw std::runtime_error("WebPMuxAssemble failed");
    }

    std::ofstream out(output, std::ios::binary);
    if (!out) {
        WebPDataClear(&final_data);
        throw std::runtime_error("Cannot open WebP output: " + output.string());
    }
    out.write(reinterpret_cast<const char*>(final_data.bytes), static_cast<std::streamsize>(final_data.size));
    WebPDataClear(&final_data);
    out.close();
    if (!out) {
        throw std::runtime_error("Write failed for " + output.string());
    }
}

} // namespace metawipe::image
