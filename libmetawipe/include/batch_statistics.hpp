#ifndef METAWIPE_BATCH_STATISTICS_HPP
#define METAWIPE_BATCH_STATISTICS_HPP

#include "clean_outcome.hpp"
#include "file_category.hpp"
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace metawipe {

/**
 * @brief Aggregate counters of one run.
 *
 * Written only by the orchestrator's processing loop. At the end of every
 * run, interrupted ones included, cleaned + failed + skipped == total_files.
 */
struct BatchStatistics {
    std::size_t total_files = 0;
    std::size_t cleaned = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;                                ///< Never processed (interrupt)
    std::map<FileCategory, std::size_t> by_category;        ///< Every recorded file
    std::map<std::string, std::size_t> by_method;           ///< Successful files, keyed by strategy name
    std::map<CleanMethod, std::size_t> by_method_kind;      ///< Every recorded file, keyed by method kind
    double elapsed_seconds = 0.0;
    std::optional<std::filesystem::path> backup_dir;

    /// Fold one dispatched file into the counters.
    void record(const CleanOutcome& outcome);

    /// Count every file not yet recorded as skipped.
    void mark_remaining_skipped();

    [[nodiscard]] std::size_t processed() const noexcept { return cleaned + failed; }

    [[nodiscard]] bool consistent() const noexcept {
        return cleaned + failed + skipped == total_files;
    }
};

} // namespace metawipe

#endif // METAWIPE_BATCH_STATISTICS_HPP
