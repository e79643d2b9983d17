#include "../../include/timestamp_normalizer.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstring>
#include <string>

#ifdef _WIN32
#include <sys/utime.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#endif

namespace metawipe {

bool normalize_timestamps(const std::filesystem::path& path, Logger& logger) {
#ifdef _WIN32
    _utimbuf times{0, 0};
    const int rc = _wutime(path.wstring().c_str(), &times);
#else
    const timespec times[2] = {{0, 0}, {0, 0}};
    const int rc = utimensat(AT_FDCWD, path.c_str(), times, 0);
#endif
    if (rc != 0) {
        logger.warning("Cannot reset timestamps of " + path.string() + ": " + std::strerror(errno),
                       "timestamps");
        return false;
    }
    logger.debug("Timestamps reset to epoch: " + path.string(), "timestamps");
    return true;
}

} // namespace metawipe
