#include "../../include/directory_walker.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <system_error>

namespace metawipe {

namespace fs = std::filesystem;

static const char* walker_tag() {
    return "walker";
}

const std::set<std::string>& DirectoryWalker::default_exclusions() {
    static const std::set<std::string> kExcluded = {
        ".git", ".svn", ".hg", "__pycache__", "node_modules", ".venv", "venv"
    };
    return kExcluded;
}

DirectoryWalker::DirectoryWalker(Logger& logger)
    : DirectoryWalker(logger, default_exclusions()) {}

DirectoryWalker::DirectoryWalker(Logger& logger, std::set<std::string> excluded_names)
    : logger_(logger), excluded_(std::move(excluded_names)) {}

DirectoryWalker::DirectoryWalker(Logger& logger, std::set<std::string> excluded_names,
                                 const std::set<fs::path>& excluded_paths)
    : logger_(logger), excluded_(std::move(excluded_names)) {
    for (const auto& p : excluded_paths) {
        std::error_code ec;
        fs::path normal = fs::absolute(p, ec);
        if (!ec) normal = fs::weakly_canonical(normal, ec);
        excluded_paths_.insert(ec ? p.lexically_normal() : normal);
    }
}

bool DirectoryWalker::is_excluded(const fs::path& dir) const {
    return excluded_.contains(dir.filename().string());
}

bool DirectoryWalker::is_excluded_path(const fs::path& entry) const {
    return !excluded_paths_.empty() && excluded_paths_.contains(entry.lexically_normal());
}

std::vector<fs::path> DirectoryWalker::walk(const fs::path& root) const {
    std::vector<fs::path> files;
    std::vector<fs::path> pending{root};

    while (!pending.empty()) {
        const fs::path dir = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::none, ec);
        if (ec) {
            logger_.warning("Cannot read directory " + dir.string() + ": " + ec.message(), walker_tag());
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;

            const fs::path& entry = it->path();
            std::error_code st_ec;
            // symlink_status: links are neither followed nor reported
            const fs::file_status st = it->symlink_status(st_ec);
            if (st_ec) {
                logger_.debug("Cannot stat " + entry.string() + ": " + st_ec.message(), walker_tag());
                continue;
            }

            if (is_excluded_path(entry)) {
                logger_.debug("Skipping own output " + entry.string(), walker_tag());
            } else if (fs::is_directory(st)) {
                if (is_excluded(entry)) {
                    logger_.debug("Skipping excluded directory " + entry.string(), walker_tag());
                } else {
                    pending.push_back(entry);
                }
            } else if (fs::is_regular_file(st)) {
                files.push_back(entry);
            }
        }
        if (ec) {
            logger_.warning("Error while reading " + dir.string() + ": " + ec.message(), walker_tag());
        }
    }

    std::sort(files.begin(), files.end());
    logger_.debug("Walk of " + root.string() + " found " + std::to_string(files.size()) + " files", walker_tag());
    return files;
}

} // namespace metawipe
