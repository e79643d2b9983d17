#ifndef METAWIPE_DIRECTORY_WALKER_HPP
#define METAWIPE_DIRECTORY_WALKER_HPP

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace metawipe {

class Logger;

/**
 * @brief Recursively enumerates regular files under a root.
 *
 * Directories whose name is in the exclusion set are never entered:
 * the check happens before descending, so nothing beneath them is even
 * listed. Excluded paths work the same way for one specific file or
 * directory (the tool's own logs and backups); they are compared after
 * weakly_canonical(), so walk() should be given a canonical root. Symlinks and special files are skipped silently. A directory
 * that can't be read is skipped with a warning and the walk goes on.
 *
 * Each call to walk() re-enumerates from scratch.
 */
class DirectoryWalker {
public:
    /// Version-control metadata and dependency-cache directories.
    static const std::set<std::string>& default_exclusions();

    explicit DirectoryWalker(Logger& logger);
    DirectoryWalker(Logger& logger, std::set<std::string> excluded_names);
    DirectoryWalker(Logger& logger, std::set<std::string> excluded_names,
                    const std::set<std::filesystem::path>& excluded_paths);

    /**
     * @brief Walk @p root depth-first.
     * @return Regular files found, sorted by path.
     */
    [[nodiscard]] std::vector<std::filesystem::path> walk(const std::filesystem::path& root) const;

    [[nodiscard]] bool is_excluded(const std::filesystem::path& dir) const;

    [[nodiscard]] bool is_excluded_path(const std::filesystem::path& entry) const;

private:
    Logger& logger_;
    std::set<std::string> excluded_;
    std::set<std::filesystem::path> excluded_paths_;
};

} // namespace metawipe

#endif // METAWIPE_DIRECTORY_WALKER_HPP
