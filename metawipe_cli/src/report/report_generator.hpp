#ifndef METAWIPE_REPORT_GENERATOR_HPP
#define METAWIPE_REPORT_GENERATOR_HPP

#include "../../../libmetawipe/include/availability.hpp"
#include "../../../libmetawipe/include/batch_statistics.hpp"
#include "../../../libmetawipe/include/clean_outcome.hpp"
#include "../utils/color.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

struct FileResult {
    std::filesystem::path path;
    metawipe::FileCategory category = metawipe::FileCategory::Unknown;
    bool success{};
    metawipe::CleanMethod method = metawipe::CleanMethod::None;
    std::string strategy;   // strategy that succeeded, empty on failure
    bool backed_up{};
    double seconds{};
};

unsigned get_terminal_width();

/// Human-readable size with two decimals (B, KB, MB, GB, TB).
std::string format_size(std::uintmax_t size_bytes);

/// Cuts @p name to @p max_len bytes with a trailing "...", never inside a UTF-8 sequence.
std::string truncate_name(const std::string& name, std::size_t max_len = 50);

std::string csv_escape(const std::string& data);

void print_banner(const Palette& c);

void print_dependencies(const metawipe::DependencyAvailability& availability, const Palette& c);

/// One-line progress indicator, rewritten in place on stderr.
void print_progress_line(std::size_t current, std::size_t total,
                         const std::string& filename, bool success, const Palette& c);

void print_dry_run_report(const std::map<metawipe::FileCategory, std::size_t>& by_category, const Palette& c);

void print_summary(const metawipe::BatchStatistics& stats, const Palette& c);

/**
 * @brief Writes one CSV row per processed file plus a totals block.
 * @return false if the file could not be written.
 */
bool export_csv_report(const std::vector<FileResult>& results,
                       const metawipe::BatchStatistics& stats,
                       const std::filesystem::path& output_path);

#endif // METAWIPE_REPORT_GENERATOR_HPP
