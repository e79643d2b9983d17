#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#ifndef _WIN32
#include <signal.h>
#endif
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libmetawipe/include/availability.hpp"
#include "../../libmetawipe/include/batch_orchestrator.hpp"
#include "../../libmetawipe/include/dispatch_policy.hpp"
#include "../../libmetawipe/include/events.hpp"
#include "../../libmetawipe/include/file_utils.hpp"
#include "../../libmetawipe/include/process_runner.hpp"
#include "../../libmetawipe/include/run_context.hpp"

using namespace metawipe;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c: stop between files, a second one exits at once
extern "C" void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (interrupted.exchange(true)) {
            std::_Exit(130);
        }
    }
}

static void install_signal_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#else
    // no SA_RESTART: a blocking read in the confirmation prompt must return
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
#endif
}

static fs::path default_log_path() {
    return app_data_dir() / "logs" / ("clean_" + timestamp_for_filename() + ".log");
}

static bool ask_confirmation(const std::size_t file_count, const bool backup, const Palette& c) {
    std::cout << c.yellow << c.bold << "WARNING:" << c.reset << " This will modify " << file_count << " files.\n";
    if (backup) {
        std::cout << c.green << "Backups will be created." << c.reset << "\n";
    } else {
        std::cout << c.red << "NO BACKUPS will be created. Changes are irreversible!" << c.reset << "\n";
    }
    std::cout << "\nProceed with cleaning? (yes/no): " << std::flush;

    std::string response;
    if (!std::getline(std::cin, response)) {
        std::cout << std::endl;
        return false;
    }
    const auto first = response.find_first_not_of(" \t\r");
    const auto last = response.find_last_not_of(" \t\r");
    response = first == std::string::npos ? "" : response.substr(first, last - first + 1);
    std::transform(response.begin(), response.end(), response.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return response == "yes" || response == "y";
}

int main(int argc, char* argv[]) {

    CLI::App app{"metawipe: Remove metadata and digital footprints from every file in a directory."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    install_signal_handlers();
    const Palette c = Palette::detect();

    // run context: logger and event bus shared by every component
    RunContext ctx;

    RunConfig run_config = settings.to_run_config();
    const fs::path log_path = settings.log_file.empty() ? default_log_path() : settings.log_file;
    run_config.excluded_paths.insert(log_path);
    const RunConfig& config = run_config;

    std::error_code ec;
    fs::create_directories(log_path.parent_path().empty() ? fs::path(".") : log_path.parent_path(), ec);
    auto file_sink = std::make_unique<FileLogSink>(log_path, false);
    const bool file_log_ok = file_sink->is_open();
    ctx.logger.add_sink(std::move(file_sink));

    if (!config.quiet) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = config.verbose ? LogLevel::Debug : LogLevel::Warning;
        ctx.logger.add_sink(std::move(console_sink));
    }
    if (!file_log_ok) {
        ctx.logger.warning("Cannot open log file " + log_path.string(), "main");
    }

    if (!config.quiet) {
        print_banner(c);
    }

    // --- Init: probe collaborators once ---
    const DependencyAvailability availability = DependencyAvailability::probe(config.exiftool, config.ffmpeg);
    for (const auto& [tool, available] : availability.entries()) {
        ctx.logger.info(tool + (available ? " available" : " missing"), "main");
    }
    if (!config.quiet) {
        print_dependencies(availability, c);
    }

    PosixProcessRunner runner;
    DispatchPolicy policy = DispatchPolicy::build_default(availability, runner, ctx.logger);

    std::vector<FileResult> results;

    ctx.events.subscribe<ScanCompleteEvent>([&](const ScanCompleteEvent& e) {
        if (config.quiet) return;
        std::cout << c.bold << "Target Directory:" << c.reset << " " << e.root.string() << "\n";
        if (e.file_count == 0) {
            std::cout << c.yellow << "No files found to clean." << c.reset << std::endl;
        } else {
            std::cout << c.green << "Found " << e.file_count << " files (" << format_size(e.total_bytes) << ")"
                      << c.reset << "\n" << std::endl;
        }
    });

    ctx.events.subscribe<DryRunReportEvent>([&](const DryRunReportEvent& e) {
        print_dry_run_report(e.by_category, c);
    });

    ctx.events.subscribe<FileCleanStartEvent>([&](const FileCleanStartEvent& e) {
        ctx.logger.debug("[" + std::to_string(e.index) + "/" + std::to_string(e.total) + "] " + e.path.string(),
                         "main");
    });

    ctx.events.subscribe<FileCleanCompleteEvent>([&](const FileCleanCompleteEvent& e) {
        if (!config.quiet) {
            print_progress_line(e.index, e.total, e.path.filename().string(), e.outcome.success, c);
        }
        FileResult r;
        r.path = e.path;
        r.category = e.outcome.category;
        r.success = e.outcome.success;
        r.method = e.outcome.method;
        r.strategy = e.outcome.strategy;
        r.backed_up = e.backed_up;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        results.push_back(std::move(r));
    });

    ctx.events.subscribe<BackupErrorEvent>([&](const BackupErrorEvent& e) {
        ctx.logger.warning("No backup for " + e.path.string() + " (" + e.error_message + "), cleaning anyway",
                           "main");
    });

    ctx.events.subscribe<BatchInterruptedEvent>([&](const BatchInterruptedEvent& e) {
        std::cerr << "\n" << c.yellow << "Interrupted: " << e.processed << " processed, "
                  << e.skipped << " skipped." << c.reset << std::endl;
    });

    BatchOrchestrator orchestrator(config, policy, ctx, interrupted,
                                   [&c](const std::size_t count, const bool backup) {
                                       return ask_confirmation(count, backup, c);
                                   });

    RunReport report;
    try {
        report = orchestrator.run();
    } catch (const FatalError& e) {
        ctx.logger.error(e.what(), "main");
        std::cerr << c.red << "Error: " << e.what() << c.reset << std::endl;
        return 1;
    } catch (const std::exception& e) {
        ctx.logger.error(std::string("Unexpected failure: ") + e.what(), "main");
        std::cerr << c.red << "Fatal error: " << e.what() << c.reset << std::endl;
        return 1;
    }

    switch (report.status) {
        case RunStatus::Cancelled:
            std::cout << c.yellow << "Operation cancelled." << c.reset << std::endl;
            break;
        case RunStatus::NoFiles:
        case RunStatus::DryRun:
            break;
        case RunStatus::Completed:
        case RunStatus::Interrupted:
            if (report.summarized) {
                print_summary(report.stats, c);
            }
            break;
    }

    if (!settings.report_path.empty() && report.summarized) {
        if (!export_csv_report(results, report.stats, settings.report_path)) {
            ctx.logger.error("Cannot write CSV report " + settings.report_path.string(), "main");
        }
    }

    if (!config.quiet && file_log_ok) {
        std::cout << "Log file: " << log_path.string() << std::endl;
    }

    return report.exit_code();
}
