#ifndef METAWIPE_PDF_STRATEGY_HPP
#define METAWIPE_PDF_STRATEGY_HPP

#include "strategy.hpp"
#include <array>

namespace metawipe {

class Logger;

/**
 * @brief Rewrites a PDF through qpdf without its document-level metadata.
 *
 * Removes the trailer /Info dictionary and the catalog /Metadata XMP
 * stream, then writes the document to a sibling temp file with a
 * deterministic /ID (so the random ID can't fingerprint the run) and
 * swaps it in.
 */
class PdfStrategy final : public ICleaningStrategy {
public:
    explicit PdfStrategy(Logger& logger) : logger_(logger) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "pdf-lib"; }

    [[nodiscard]] CleanMethod method() const noexcept override { return CleanMethod::Library; }

    [[nodiscard]] std::span<const FileCategory> get_supported_categories() const noexcept override {
        static constexpr std::array<FileCategory, 1> kCategories = {FileCategory::Pdf};
        return {kCategories.data(), kCategories.size()};
    }

    bool attempt(const std::filesystem::path& path, const CleanOptions& options) override;

private:
    Logger& logger_;
};

} // namespace metawipe

#endif // METAWIPE_PDF_STRATEGY_HPP
