#ifndef METAWIPE_RUN_CONFIG_HPP
#define METAWIPE_RUN_CONFIG_HPP

#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace metawipe {

/**
 * @brief Immutable snapshot of the run options, built once before processing.
 */
struct RunConfig {
    std::filesystem::path root = ".";         ///< Directory to clean
    bool dry_run = false;                     ///< Scan and classify only
    bool backup = false;                      ///< Copy each file before mutating it
    bool reencode_videos = false;             ///< Skip the stream-copy pass for videos
    bool normalize_time = false;              ///< Reset atime/mtime to the epoch after cleaning
    bool skip_confirm = false;                ///< Don't ask before processing
    bool verbose = false;
    bool quiet = false;

    std::optional<std::filesystem::path> backup_dir; ///< Overrides <app-data>/backups/<timestamp>
    std::set<std::string> excluded_dirs;             ///< Directory names never descended into
    std::set<std::filesystem::path> excluded_paths;  ///< Files or directories never walked (log, report)
    std::string exiftool = "exiftool";               ///< Metadata stripper binary (name or path)
    std::string ffmpeg = "ffmpeg";                   ///< Transcoder binary (name or path)
};

} // namespace metawipe

#endif // METAWIPE_RUN_CONFIG_HPP
