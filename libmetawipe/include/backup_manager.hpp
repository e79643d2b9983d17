#ifndef METAWIPE_BACKUP_MANAGER_HPP
#define METAWIPE_BACKUP_MANAGER_HPP

#include <filesystem>

namespace metawipe {

class Logger;

/**
 * @brief Copies files into a backup tree before they are mutated.
 *
 * A file at root/a/b.jpg is copied to backup_root/a/b.jpg (the tree is
 * anchored at the walk root itself). The copy keeps content, permissions
 * and modification time. backup_root is created lazily by the first
 * backup, never before.
 */
class BackupManager {
public:
    BackupManager(std::filesystem::path root, std::filesystem::path backup_root, Logger& logger);

    /**
     * @brief Back up @p path.
     * @return false (and logs) on any I/O failure; never throws.
     */
    bool backup(const std::filesystem::path& path);

    [[nodiscard]] const std::filesystem::path& backup_root() const noexcept { return backup_root_; }

    /// @return Where @p path is (or would be) backed up.
    [[nodiscard]] std::filesystem::path destination_for(const std::filesystem::path& path) const;

private:
    std::filesystem::path root_;
    std::filesystem::path backup_root_;
    Logger& logger_;
};

} // namespace metawipe

#endif // METAWIPE_BACKUP_MANAGER_HPP
