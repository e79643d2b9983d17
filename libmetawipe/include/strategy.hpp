#ifndef METAWIPE_STRATEGY_HPP
#define METAWIPE_STRATEGY_HPP

#include "clean_outcome.hpp"
#include "file_category.hpp"
#include <atomic>
#include <filesystem>
#include <span>
#include <string_view>

/**
 * @namespace metawipe
 * @brief The main namespace for the metawipe library.
 *
 * @details This namespace holds the cleaning strategy interface and its
 * implementations, the dispatch policy that sequences them, the batch
 * orchestrator and the helpers they share (walker, backup, logging).
 */
namespace metawipe {

/**
 * @brief Per-run options forwarded to every strategy attempt.
 */
struct CleanOptions {
    bool reencode_videos = false;                  ///< Skip the stream-copy pass and transcode directly
    const std::atomic<bool>* interrupted = nullptr; ///< Raised when the run must stop; may be null

    [[nodiscard]] bool interrupt_requested() const noexcept {
        return interrupted && interrupted->load(std::memory_order_relaxed);
    }
};

/**
 * @brief Interface for one self-contained way of stripping metadata.
 *
 * Each implementation wraps exactly one collaborator (an external binary
 * or a linked library) and declares the categories it can handle.
 *
 * attempt() never throws to its caller: collaborator failures (non-zero
 * exit, library exception) are logged and reported as false. Mutating
 * implementations write to a sibling temp file and swap it in with a
 * single rename, so the original is either fully replaced or untouched.
 */
class ICleaningStrategy {
public:
    virtual ~ICleaningStrategy() = default;

    /// @return Short strategy name used in logs and statistics (e.g. "exiftool").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return Kind of collaborator this strategy wraps.
    [[nodiscard]] virtual CleanMethod method() const noexcept = 0;

    /// @return Categories this strategy accepts.
    [[nodiscard]] virtual std::span<const FileCategory> get_supported_categories() const noexcept = 0;

    /**
     * @brief Strip metadata from @p path in place.
     * @return true if the file now carries no removable metadata.
     */
    virtual bool attempt(const std::filesystem::path& path, const CleanOptions& options) = 0;
};

} // namespace metawipe

#endif // METAWIPE_STRATEGY_HPP
