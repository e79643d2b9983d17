#include "../../include/batch_orchestrator.hpp"
#include "../../include/backup_manager.hpp"
#include "../../include/directory_walker.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include <chrono>
#include <memory>
#include <set>
#include <system_error>

namespace metawipe {

namespace fs = std::filesystem;

static const char* orchestrator_tag() {
    return "orchestrator";
}

const char* state_to_string(const RunState state) noexcept {
    switch (state) {
        case RunState::Init:         return "init";
        case RunState::Scanning:     return "scanning";
        case RunState::DryRunReport: return "dry_run_report";
        case RunState::Confirming:   return "confirming";
        case RunState::Processing:   return "processing";
        case RunState::Summarizing:  return "summarizing";
        case RunState::Done:         return "done";
    }
    return "unknown";
}

int RunReport::exit_code() const noexcept {
    if (status == RunStatus::Interrupted && !summarized) {
        return 130;
    }
    return stats.failed > 0 ? 1 : 0;
}

BatchOrchestrator::BatchOrchestrator(const RunConfig& config,
                                     DispatchPolicy& policy,
                                     RunContext& ctx,
                                     const std::atomic<bool>& interrupted,
                                     ConfirmCallback confirm)
    : config_(config),
      policy_(policy),
      ctx_(ctx),
      interrupted_(interrupted),
      confirm_(std::move(confirm)),
      backup_root_(config.backup_dir ? *config.backup_dir
                                     : app_data_dir() / "backups" / timestamp_for_filename()) {}

void BatchOrchestrator::transition(const RunState next) {
    ctx_.logger.debug(std::string(state_to_string(state_)) + " -> " + state_to_string(next), orchestrator_tag());
    state_ = next;
}

fs::path BatchOrchestrator::resolve_root() const {
    std::error_code ec;
    fs::path root = fs::absolute(config_.root, ec);
    if (ec) {
        throw FatalError("Cannot resolve path " + config_.root.string() + ": " + ec.message());
    }
    root = fs::weakly_canonical(root, ec);
    if (ec) {
        throw FatalError("Cannot resolve path " + config_.root.string() + ": " + ec.message());
    }
    if (!fs::exists(root, ec)) {
        throw FatalError("Path does not exist: " + root.string());
    }
    if (!fs::is_directory(root, ec)) {
        throw FatalError("Path is not a directory: " + root.string());
    }
    return root;
}

RunReport BatchOrchestrator::run() {
    const auto start = std::chrono::steady_clock::now();
    RunReport report;

    // --- Init ---
    const fs::path root = resolve_root();
    ctx_.logger.info("Cleaning run on " + root.string() + (config_.dry_run ? " (dry run)" : ""), orchestrator_tag());

    // --- Scanning ---
    transition(RunState::Scanning);
    std::set<std::string> excluded = DirectoryWalker::default_exclusions();
    excluded.insert(config_.excluded_dirs.begin(), config_.excluded_dirs.end());
    // earlier backups and logs may sit under the root; never clean them
    std::set<fs::path> own_output = config_.excluded_paths;
    own_output.insert(app_data_dir());
    own_output.insert(backup_root_);
    const DirectoryWalker walker(ctx_.logger, std::move(excluded), own_output);
    const std::vector<fs::path> files = walker.walk(root);

    std::uintmax_t total_bytes = 0;
    for (const auto& f : files) {
        std::error_code ec;
        const auto size = fs::file_size(f, ec);
        if (!ec) total_bytes += size;
    }
    report.stats.total_files = files.size();
    ctx_.events.publish(ScanCompleteEvent{root, files.size(), total_bytes});

    if (files.empty()) {
        ctx_.logger.info("No files found under " + root.string(), orchestrator_tag());
        report.status = RunStatus::NoFiles;
        transition(RunState::Done);
        return report;
    }

    if (is_interrupted()) {
        report.status = RunStatus::Interrupted;
        report.stats.mark_remaining_skipped();
        transition(RunState::Done);
        return report;
    }

    // --- DryRunReport ---
    if (config_.dry_run) {
        transition(RunState::DryRunReport);
        report_dry_run(files, report.stats);
        report.status = RunStatus::DryRun;
        transition(RunState::Done);
        return report;
    }

    // --- Confirming ---
    if (!config_.skip_confirm) {
        transition(RunState::Confirming);
        const bool confirmed = confirm_ && confirm_(files.size(), config_.backup);
        if (is_interrupted()) {
            report.status = RunStatus::Interrupted;
            report.stats.mark_remaining_skipped();
            transition(RunState::Done);
            return report;
        }
        if (!confirmed) {
            ctx_.logger.info("Run cancelled by user", orchestrator_tag());
            report.status = RunStatus::Cancelled;
            report.stats.mark_remaining_skipped();
            transition(RunState::Done);
            return report;
        }
    }

    // --- Processing ---
    transition(RunState::Processing);
    process_files(root, files, report);

    // --- Summarizing ---
    transition(RunState::Summarizing);
    report.stats.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    report.summarized = true;
    ctx_.logger.info("Cleaned " + std::to_string(report.stats.cleaned) +
                     ", failed " + std::to_string(report.stats.failed) +
                     ", skipped " + std::to_string(report.stats.skipped) +
                     " of " + std::to_string(report.stats.total_files), orchestrator_tag());

    transition(RunState::Done);
    return report;
}

void BatchOrchestrator::report_dry_run(const std::vector<fs::path>& files, BatchStatistics& stats) {
    DryRunReportEvent event;
    for (const auto& f : files) {
        const FileCategory cat = classify(f);
        ++event.by_category[cat];
        ++stats.by_category[cat];
    }
    stats.mark_remaining_skipped();
    ctx_.events.publish(event);
}

void BatchOrchestrator::process_files(const fs::path& root,
                                      const std::vector<fs::path>& files,
                                      RunReport& report) {
    std::unique_ptr<BackupManager> backup;
    if (config_.backup) {
        backup = std::make_unique<BackupManager>(root, backup_root_, ctx_.logger);
        report.stats.backup_dir = backup_root_;
    }

    const CleanOptions options{config_.reencode_videos, &interrupted_};
    const std::size_t total = files.size();
    report.status = RunStatus::Completed;

    for (std::size_t i = 0; i < total; ++i) {
        if (is_interrupted()) {
            report.status = RunStatus::Interrupted;
            break;
        }

        const fs::path& file = files[i];
        const auto file_start = std::chrono::steady_clock::now();
        ctx_.events.publish(FileCleanStartEvent{file, i + 1, total});

        bool backed_up = false;
        if (backup) {
            backed_up = backup->backup(file);
            if (!backed_up) {
                ctx_.events.publish(BackupErrorEvent{file, "backup copy failed"});
            }
        }

        const CleanOutcome outcome = policy_.dispatch(file, options, config_.normalize_time);

        if (is_interrupted()) {
            ctx_.logger.info("Interrupted while processing " + file.string() + ", outcome not recorded",
                             orchestrator_tag());
            report.status = RunStatus::Interrupted;
            break;
        }

        report.stats.record(outcome);
        ctx_.events.publish(FileCleanCompleteEvent{
            file, outcome, backed_up, i + 1, total,
            std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - file_start)
        });
    }

    if (report.status == RunStatus::Interrupted) {
        report.stats.mark_remaining_skipped();
        ctx_.logger.warning("Run interrupted, " + std::to_string(report.stats.skipped) + " files skipped",
                            orchestrator_tag());
        ctx_.events.publish(BatchInterruptedEvent{report.stats.processed(), report.stats.skipped});
    }
}

} // namespace metawipe
