#ifndef METAWIPE_OOXML_STRATEGY_HPP
#define METAWIPE_OOXML_STRATEGY_HPP

#include "strategy.hpp"
#include <array>
#include <string>

namespace metawipe {

class Logger;

/**
 * @brief Rebuilds an Office Open XML package (docx/xlsx/pptx) with cleared properties.
 *
 * The zip is streamed entry by entry through libarchive into a sibling
 * temp package:
 * - docProps/core.xml is replaced by an empty core-properties part
 *   (title, subject, creator, keywords, description, lastModifiedBy,
 *   category and contentStatus empty; dates and revision dropped),
 * - docProps/app.xml keeps its structure but Company, Manager and
 *   Template are blanked,
 * - docProps/custom.xml is replaced by an empty property set,
 * - every other part is copied byte for byte, with a zero timestamp.
 *
 * Legacy binary .doc/.xls/.ppt files are not packages and are reported
 * as failures.
 */
class OoxmlStrategy final : public ICleaningStrategy {
public:
    explicit OoxmlStrategy(Logger& logger) : logger_(logger) {}

    [[nodiscard]] std::string_view get_name() const noexcept override { return "office-lib"; }

    [[nodiscard]] CleanMethod method() const noexcept override { return CleanMethod::Library; }

    [[nodiscard]] std::span<const FileCategory> get_supported_categories() const noexcept override {
        static constexpr std::array<FileCategory, 3> kCategories = {
            FileCategory::Docx, FileCategory::Xlsx, FileCategory::Pptx
        };
        return {kCategories.data(), kCategories.size()};
    }

    bool attempt(const std::filesystem::path& path, const CleanOptions& options) override;

    /// @return The replacement content of docProps/core.xml.
    [[nodiscard]] static std::string empty_core_properties();

    /// @return @p app_xml with Company, Manager and Template emptied.
    [[nodiscard]] static std::string scrub_app_properties(const std::string& app_xml);

private:
    Logger& logger_;
};

} // namespace metawipe

#endif // METAWIPE_OOXML_STRATEGY_HPP
