#ifndef METAWIPE_CLEAN_OUTCOME_HPP
#define METAWIPE_CLEAN_OUTCOME_HPP

#include "file_category.hpp"
#include <string>
#include <string_view>

namespace metawipe {

/**
 * @brief Kind of collaborator that produced a successful clean.
 */
enum class CleanMethod {
    None,          ///< Strategies were attempted, none succeeded
    ExternalTool,  ///< An external binary (metadata stripper or transcoder)
    Library,       ///< An in-process library rewrite
    NoneAvailable  ///< No strategy applied to the file at all
};

/// @return Snake-case method name (e.g. "external_tool").
[[nodiscard]] constexpr std::string_view method_to_string(const CleanMethod method) noexcept {
    switch (method) {
        case CleanMethod::None:          return "none";
        case CleanMethod::ExternalTool:  return "external_tool";
        case CleanMethod::Library:       return "library";
        case CleanMethod::NoneAvailable: return "none_available";
    }
    return "none";
}

/**
 * @brief Result of dispatching one file.
 *
 * Invariant: method is None or NoneAvailable exactly when success is false.
 */
struct CleanOutcome {
    bool success = false;
    CleanMethod method = CleanMethod::None;
    FileCategory category = FileCategory::Unknown;
    std::string strategy;   ///< Name of the strategy that succeeded (e.g. "exiftool"), empty on failure
};

} // namespace metawipe

#endif // METAWIPE_CLEAN_OUTCOME_HPP
