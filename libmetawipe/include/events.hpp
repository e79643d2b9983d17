#ifndef METAWIPE_EVENTS_HPP
#define METAWIPE_EVENTS_HPP

#include "clean_outcome.hpp"
#include "file_category.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace metawipe {

/**
 * @brief Events published by the BatchOrchestrator while a run advances.
 *
 * These lightweight structs are used with EventBus to notify subscribers
 * (CLI progress bar, CSV report, tests) about progress and results.
 * They are plain data carriers.
 */

// --- Scanning ---

/**
 * @brief Emitted once the walker has enumerated the root.
 */
struct ScanCompleteEvent {
    std::filesystem::path root;  ///< Resolved walk root
    std::size_t file_count = 0;  ///< Number of regular files found
    std::uintmax_t total_bytes = 0; ///< Sum of their sizes
};

/**
 * @brief Emitted in dry-run mode with the category histogram of the scan.
 */
struct DryRunReportEvent {
    std::map<FileCategory, std::size_t> by_category;
};

// --- Processing ---

/**
 * @brief Emitted right before a file is backed up and dispatched.
 */
struct FileCleanStartEvent {
    std::filesystem::path path;
    std::size_t index = 0; ///< 1-based position in the batch
    std::size_t total = 0;
};

/**
 * @brief Emitted when a file's outcome has been folded into the statistics.
 */
struct FileCleanCompleteEvent {
    std::filesystem::path path;
    CleanOutcome outcome;
    bool backed_up = false;              ///< True if a backup copy was written for this file
    std::size_t index = 0;               ///< 1-based position in the batch
    std::size_t total = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a backup copy could not be written. Cleaning still proceeds.
 */
struct BackupErrorEvent {
    std::filesystem::path path;
    std::string error_message;
};

/**
 * @brief Emitted when an interrupt stopped the processing loop.
 */
struct BatchInterruptedEvent {
    std::size_t processed = 0; ///< Files whose outcome was recorded
    std::size_t skipped = 0;   ///< Files never processed
};

} // namespace metawipe

#endif // METAWIPE_EVENTS_HPP
