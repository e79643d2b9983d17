#include "../../include/image_library_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>

namespace metawipe {

namespace fs = std::filesystem;

static const char* strategy_tag() {
    return "image_library";
}

bool ImageLibraryStrategy::attempt(const fs::path& path, const CleanOptions& /*options*/) {
    const std::string ext = normalize_extension(path.extension().string());

    void (*rewrite)(const fs::path&, const fs::path&, Logger&) = nullptr;
    if (ext == ".jpg" || ext == ".jpeg" || ext == ".jpe" || ext == ".jfif") {
        rewrite = image::rewrite_jpeg;
    } else if (ext == ".png") {
        rewrite = image::rewrite_png;
    } else if (ext == ".webp") {
        rewrite = image::rewrite_webp;
    } else {
        logger_.info("No image rewriter for " + ext + ": " + path.string(), strategy_tag());
        return false;
    }

    TempFile temp(path, "img", logger_);
    try {
        rewrite(path, temp.path(), logger_);
    } catch (const std::exception& e) {
        logger_.error("Image rewrite failed for " + path.string() + ": " + e.what(), strategy_tag());
        return false;
    }

    if (!temp.commit()) {
        return false;
    }
    logger_.debug("Image rewritten without metadata: " + path.string(), strategy_tag());
    return true;
}

} // namespace metawipe
