/**
 * @file batch_orchestrator.hpp
 * @brief Defines the state machine that drives a whole cleaning run.
 */

#ifndef METAWIPE_BATCH_ORCHESTRATOR_HPP
#define METAWIPE_BATCH_ORCHESTRATOR_HPP

#include "batch_statistics.hpp"
#include "dispatch_policy.hpp"
#include "run_config.hpp"
#include "run_context.hpp"
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <vector>

namespace metawipe {

/**
 * @brief Thrown when the run can't start at all (missing or unreadable root).
 *
 * Raised before any file is touched.
 */
class FatalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Phases of a run. Transitions only move forward.
 */
enum class RunState {
    Init,
    Scanning,
    DryRunReport,
    Confirming,
    Processing,
    Summarizing,
    Done
};

/**
 * @brief How a run ended.
 */
enum class RunStatus {
    Completed,   ///< Every file was dispatched
    NoFiles,     ///< The walk found nothing
    DryRun,      ///< Classification only
    Cancelled,   ///< The confirmation was declined
    Interrupted  ///< An interrupt stopped the run
};

[[nodiscard]] const char* state_to_string(RunState state) noexcept;

/**
 * @brief Result of BatchOrchestrator::run().
 */
struct RunReport {
    RunStatus status = RunStatus::Completed;
    BatchStatistics stats;
    bool summarized = false; ///< True if the run went through Summarizing

    /**
     * @brief Process exit status for this run.
     * @return 130 if interrupted before Summarizing, 1 if any file failed, 0 otherwise.
     */
    [[nodiscard]] int exit_code() const noexcept;
};

/**
 * @brief Callback asked before processing: (file count, backup enabled) -> proceed?
 */
using ConfirmCallback = std::function<bool(std::size_t, bool)>;

/**
 * @brief Drives the walk -> dispatch -> aggregate loop.
 *
 * @details Runs Init -> Scanning -> (DryRunReport | Confirming) ->
 * Processing -> Summarizing -> Done, strictly sequentially: each file is
 * backed up, dispatched and recorded before the next one starts.
 *
 * The walk never enters the application-data directory, the backup root or
 * RunConfig::excluded_paths. The interrupt flag is polled between files
 * and forwarded to the dispatch policy. When it is raised during
 * Processing, the file in flight is not recorded, every unprocessed file
 * counts as skipped and the run still summarizes. Progress and results are
 * published on the RunContext's EventBus.
 */
class BatchOrchestrator {
public:
    /**
     * @param config Run options.
     * @param policy Dispatch table built for this run.
     * @param ctx Logger and event bus.
     * @param interrupted Set asynchronously (e.g. by a SIGINT handler).
     * @param confirm Asked unless config.skip_confirm; an empty callback declines.
     */
    BatchOrchestrator(const RunConfig& config,
                      DispatchPolicy& policy,
                      RunContext& ctx,
                      const std::atomic<bool>& interrupted,
                      ConfirmCallback confirm = {});

    /**
     * @brief Execute the whole run.
     * @throws FatalError if the root does not exist or is not a directory.
     */
    RunReport run();

    /// @return The timestamped (or overridden) backup directory for this run.
    [[nodiscard]] const std::filesystem::path& backup_root() const noexcept { return backup_root_; }

private:
    void transition(RunState next);
    [[nodiscard]] bool is_interrupted() const noexcept { return interrupted_.load(std::memory_order_relaxed); }

    std::filesystem::path resolve_root() const;
    void report_dry_run(const std::vector<std::filesystem::path>& files, BatchStatistics& stats);
    void process_files(const std::filesystem::path& root,
                       const std::vector<std::filesystem::path>& files,
                       RunReport& report);

    const RunConfig& config_;
    DispatchPolicy& policy_;
    RunContext& ctx_;
    const std::atomic<bool>& interrupted_;
    ConfirmCallback confirm_;
    RunState state_ = RunState::Init;
    std::filesystem::path backup_root_;
};

} // namespace metawipe

#endif // METAWIPE_BATCH_ORCHESTRATOR_HPP
