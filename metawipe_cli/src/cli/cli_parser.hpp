#ifndef METAWIPE_CLI_PARSER_HPP
#define METAWIPE_CLI_PARSER_HPP

#include "../../../libmetawipe/include/run_config.hpp"
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path path = ".";
    bool dry_run = false;
    bool backup = false;
    bool reencode_videos = false;
    bool normalize_time = false;
    bool skip_confirm = false;
    bool verbose = false;
    bool quiet = false;

    std::filesystem::path backup_dir;
    std::filesystem::path log_file;
    std::filesystem::path report_path;
    std::vector<std::string> exclude_dirs;
    std::string exiftool = "exiftool";
    std::string ffmpeg = "ffmpeg";

    /// Snapshot handed to the orchestrator.
    [[nodiscard]] metawipe::RunConfig to_run_config() const;
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // METAWIPE_CLI_PARSER_HPP
