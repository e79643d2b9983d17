#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

metawipe::RunConfig Settings::to_run_config() const {
    metawipe::RunConfig config;
    config.root = path;
    config.dry_run = dry_run;
    config.backup = backup;
    config.reencode_videos = reencode_videos;
    config.normalize_time = normalize_time;
    config.skip_confirm = skip_confirm;
    config.verbose = verbose;
    config.quiet = quiet;
    if (!backup_dir.empty()) {
        config.backup_dir = backup_dir;
    }
    config.excluded_dirs.insert(exclude_dirs.begin(), exclude_dirs.end());
    config.exiftool = exiftool;
    config.ffmpeg = ffmpeg;
    // our own output files never get cleaned
    if (!log_file.empty()) config.excluded_paths.insert(log_file);
    if (!report_path.empty()) config.excluded_paths.insert(report_path);
    return config;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", METAWIPE_VERSION);
    app.set_config("--config", "", "Read options from an INI/TOML file (keys are long option names).");

    app.add_option("-p,--path", settings.path,
                   "Directory to clean (default: current directory).")
                   ->default_val(".");

    // --- Flags (booleans) ---
    app.add_flag("--dry-run", settings.dry_run,
                 "Show what would be cleaned without making changes.");

    app.add_flag("--backup", settings.backup,
                 "Copy every file to a timestamped backup directory before cleaning it.");

    app.add_flag("--reencode-videos", settings.reencode_videos,
                 "Re-encode videos instead of trying a stream copy first (slower, thorough).");

    app.add_flag("--normalize-time", settings.normalize_time,
                 "Set access/modification times of cleaned files to the epoch.");

    app.add_flag("-v,--verbose", settings.verbose,
                 "Print debug logging to the console.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress progress and log output (summary is still printed).");

    app.add_flag("--skip-confirm", settings.skip_confirm,
                 "Don't ask for confirmation before modifying files.");

    // --- Options ---
    app.add_option("--backup-dir", settings.backup_dir,
                   "Backup root (default: <app-data>/backups/<timestamp>). Implies --backup.");

    app.add_option("--log-file", settings.log_file,
                   "Write the run log here (default: <app-data>/logs/clean_<timestamp>.log).");

    app.add_option("--report", settings.report_path,
                   "Export a per-file CSV report.")
                   ->take_last();

    app.add_option("--exclude-dir", settings.exclude_dirs,
                   "Directory NAME never descended into (can be used multiple times).");

    app.add_option("--exiftool", settings.exiftool,
                   "exiftool binary name or path.")
                   ->default_val("exiftool");

    app.add_option("--ffmpeg", settings.ffmpeg,
                   "ffmpeg binary name or path.")
                   ->default_val("ffmpeg");

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.verbose && settings.quiet) {
            throw CLI::ValidationError("--verbose and --quiet cannot be used together.");
        }
        if (!settings.backup_dir.empty()) {
            settings.backup = true;
        }
    });
}
