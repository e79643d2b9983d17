#include "../../include/backup_manager.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace metawipe {

namespace fs = std::filesystem;

static const char* backup_tag() {
    return "backup";
}

BackupManager::BackupManager(fs::path root, fs::path backup_root, Logger& logger)
    : root_(std::move(root)), backup_root_(std::move(backup_root)), logger_(logger) {}

fs::path BackupManager::destination_for(const fs::path& path) const {
    std::error_code ec;
    fs::path rel = fs::relative(path, root_, ec);
    // outside the root (or relative() failed): keep just the name
    if (ec || rel.empty() || *rel.begin() == "..") {
        rel = path.filename();
    }
    return backup_root_ / rel;
}

bool BackupManager::backup(const fs::path& path) {
    const fs::path dest = destination_for(path);

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) {
        logger_.error("Cannot create backup directory " + dest.parent_path().string() + ": " + ec.message(),
                      backup_tag());
        return false;
    }

    fs::copy_file(path, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        logger_.error("Backup of " + path.string() + " failed: " + ec.message(), backup_tag());
        return false;
    }

    const auto mtime = fs::last_write_time(path, ec);
    if (!ec) {
        fs::last_write_time(dest, mtime, ec);
    }
    if (ec) {
        logger_.error("Cannot preserve modification time on " + dest.string() + ": " + ec.message(),
                      backup_tag());
        return false;
    }

    const auto perms = fs::status(path, ec).permissions();
    if (!ec) {
        fs::permissions(dest, perms, fs::perm_options::replace, ec);
    }
    if (ec) {
        logger_.warning("Cannot copy permissions to " + dest.string() + ": " + ec.message(), backup_tag());
    }

    logger_.debug("Backed up " + path.string() + " -> " + dest.string(), backup_tag());
    return true;
}

} // namespace metawipe
