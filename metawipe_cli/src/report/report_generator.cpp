#include "report_generator.hpp"
#include <iomanip>
#include <iostream>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

using metawipe::FileCategory;

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

std::string format_size(std::uintmax_t size_bytes) {
    static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(size_bytes);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    for (const char* unit : kUnits) {
        if (size < 1024.0) {
            oss << size << " " << unit;
            return oss.str();
        }
        size /= 1024.0;
    }
    oss << size << " TB";
    return oss.str();
}

std::string truncate_name(const std::string& name, const std::size_t max_len) {
    if (name.size() <= max_len || max_len < 3) {
        return name;
    }
    std::size_t cut = max_len - 3;
    // don't split a multi-byte character
    while (cut > 0 && (static_cast<unsigned char>(name[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return name.substr(0, cut) + "...";
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char ch : data) {
        if (ch == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(ch);
    }
    result.push_back('"');
    return result;
}

static std::string capitalize(std::string_view s) {
    std::string out(s);
    if (!out.empty() && out[0] >= 'a' && out[0] <= 'z') {
        out[0] = static_cast<char>(out[0] - 'a' + 'A');
    }
    return out;
}

void print_banner(const Palette& c) {
    std::cout << c.cyan << c.bold
              << "╔═══════════════════════════════════════════════════════════╗\n"
              << "║         METAWIPE - METADATA CLEANER v2.0                  ║\n"
              << "║         Complete Privacy & Footprint Removal              ║\n"
              << "╚═══════════════════════════════════════════════════════════╝"
              << c.reset << "\n";
}

void print_dependencies(const metawipe::DependencyAvailability& availability, const Palette& c) {
    std::cout << "\n" << c.bold << "Available Tools:" << c.reset << "\n";
    for (const auto& [tool, available] : availability.entries()) {
        std::cout << "  " << (available ? c.green : c.red) << (available ? "✓" : "✗") << c.reset
                  << " " << tool << "\n";
    }

    for (const auto name : {metawipe::deps::kExiftool, metawipe::deps::kFfmpeg}) {
        if (availability.has(name)) continue;
        std::cout << "\n" << c.yellow << "⚠ Warning: " << name << " not found."
                  << (name == metawipe::deps::kExiftool ? " Install for best results:"
                                                        : " Video cleaning is disabled:")
                  << c.reset << "\n"
                  << "  " << metawipe::DependencyAvailability::install_hint(name) << "\n";
    }
    std::cout << std::endl;
}

void print_progress_line(const std::size_t current, const std::size_t total,
                         const std::string& filename, const bool success, const Palette& c) {
    constexpr std::size_t bar_length = 40;
    const double progress = total ? static_cast<double>(current) / static_cast<double>(total) : 1.0;
    const auto filled = static_cast<std::size_t>(bar_length * progress);

    std::string bar;
    for (std::size_t i = 0; i < bar_length; ++i) {
        bar += i < filled ? "█" : "░";
    }

    std::ostringstream line;
    line << (success ? c.green : c.red) << (success ? "✓" : "✗") << c.reset
         << " [" << bar << "] "
         << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
         << " (" << current << "/" << total << ") "
         << truncate_name(filename);

    // erase the tail of a longer previous line
    std::cerr << "\r" << line.str() << (*c.reset ? "\033[K" : "") << std::flush;
}

void print_dry_run_report(const std::map<FileCategory, std::size_t>& by_category, const Palette& c) {
    std::cout << c.yellow << "DRY RUN - No files will be modified" << c.reset << "\n\n"
              << c.bold << "Files by type:" << c.reset << "\n";
    for (const auto& [category, count] : by_category) {
        std::cout << "  " << metawipe::category_to_string(category) << ": " << count << "\n";
    }
    std::cout << "\n" << c.green << "Preview complete. Run without --dry-run to clean files." << c.reset
              << std::endl;
}

void print_summary(const metawipe::BatchStatistics& stats, const Palette& c) {
    std::cout << "\n\n" << c.bold << c.cyan
              << "╔═══════════════════════════════════════════════════════════╗\n"
              << "║                    CLEANING SUMMARY                       ║\n"
              << "╚═══════════════════════════════════════════════════════════╝"
              << c.reset << "\n\n";

    std::cout << c.bold << "Files Processed:" << c.reset << "\n"
              << "  Total files found:      " << stats.total_files << "\n"
              << "  Successfully cleaned:   " << c.green << stats.cleaned << c.reset << "\n"
              << "  Failed:                 " << c.red << stats.failed << c.reset << "\n"
              << "  Skipped:                " << c.yellow << stats.skipped << c.reset << "\n";

    std::cout << "\n" << c.bold << "By File Type:" << c.reset << "\n";
    for (const auto& [category, count] : stats.by_category) {
        if (count > 0) {
            std::cout << "  " << capitalize(metawipe::category_to_string(category)) << ": " << count << "\n";
        }
    }

    std::cout << "\n" << c.bold << "Methods Used:" << c.reset << "\n";
    for (const auto& [method, count] : stats.by_method) {
        if (count > 0) {
            std::cout << "  " << method << ": " << count << "\n";
        }
    }

    std::cout << "\n" << c.bold << "Total Time:" << c.reset << " "
              << std::fixed << std::setprecision(2) << stats.elapsed_seconds << " seconds\n";

    if (stats.backup_dir) {
        std::cout << "\n" << c.green << "✓ Backups saved to: " << stats.backup_dir->string() << c.reset << "\n";
    }
    std::cout << std::endl;
}

bool export_csv_report(const std::vector<FileResult>& results,
                       const metawipe::BatchStatistics& stats,
                       const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Category,Result,Method,Strategy,Backup,Time(s)\n";
    for (const auto& r : results) {
        std::ostringstream osstime;
        osstime << std::fixed << std::setprecision(2) << r.seconds;
        out << csv_escape(r.path.string()) << ","
            << metawipe::category_to_string(r.category) << ","
            << (r.success ? "OK" : "FAIL") << ","
            << metawipe::method_to_string(r.method) << ","
            << csv_escape(r.strategy) << ","
            << (r.backed_up ? "yes" : "no") << ","
            << osstime.str() << "\n";
    }

    out << "\n\nTotal,Cleaned,Failed,Skipped,Time(s)\n";
    out << stats.total_files << "," << stats.cleaned << "," << stats.failed << "," << stats.skipped << ","
        << std::fixed << std::setprecision(2) << stats.elapsed_seconds << "\n";
    return static_cast<bool>(out);
}
