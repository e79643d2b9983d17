/**
 * @file image_library_strategy.hpp
 * @brief In-process image rewrite used when the external stripper is missing or failed.
 */

#ifndef METAWIPE_IMAGE_LIBRARY_STRATEGY_HPP
#define METAWIPE_IMAGE_LIBRARY_STRATEGY_HPP

#include "strategy.hpp"
#include <array>
#include <filesystem>

namespace metawipe {

class Logger;

/**
 * @brief Rebuilds JPEG, PNG and WebP images without their ancillary metadata.
 *
 * - JPEG: DCT coefficients are copied losslessly; no APPn/COM markers are written.
 * - PNG: pixel rows are re-encoded with only IHDR, PLTE, tRNS, IDAT and IEND.
 * - WebP: EXIF, XMP and ICCP chunks are dropped from the RIFF container.
 *
 * Other image formats (TIFF, HEIC, RAW...) are reported as failures.
 */
class ImageLibraryStrategy final : public ICleaningStrategy {
public:
    explicit ImageLibraryStrategy(Logger& logger) : logger_(logger) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "image-lib"; }

    [[nodiscard]] CleanMethod method() const noexcept override { return CleanMethod::Library; }

    [[nodiscard]] std::span<const FileCategory> get_supported_categories() const noexcept override {
        static constexpr std::array<FileCategory, 1> kCategories = {FileCategory::Image};
        return {kCategories.data(), kCategories.size()};
    }

    /// @return Extensions this strategy can actually rewrite.
    [[nodiscard]] static std::span<const std::string_view> get_supported_extensions() noexcept {
        static constexpr std::array<std::string_view, 6> kExts = {
            ".jpg", ".jpeg", ".jpe", ".jfif", ".png", ".webp"
        };
        return {kExts.data(), kExts.size()};
    }

    bool attempt(const std::filesystem::path& path, const CleanOptions& options) override;

private:
    Logger& logger_;
};

/// Rewriters used by ImageLibraryStrategy. Each throws std::runtime_error on failure.
namespace image {

    void rewrite_jpeg(const std::filesystem::path& input, const std::filesystem::path& output, Logger& logger);

    void rewrite_png(const std::filesystem::path& input, const std::filesystem::path& output, Logger& logger);

    void rewrite_webp(const std::filesystem::path& input, const std::filesystem::path& output, Logger& logger);

} // namespace image

} // namespace metawipe

#endif // METAWIPE_IMAGE_LIBRARY_STRATEGY_HPP
