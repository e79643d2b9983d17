#ifndef METAWIPE_TIMESTAMP_NORMALIZER_HPP
#define METAWIPE_TIMESTAMP_NORMALIZER_HPP

#include <filesystem>

namespace metawipe {

class Logger;

/**
 * @brief Sets the access and modification times of @p path to the Unix epoch.
 *
 * Best-effort: a failure is logged and reported, never thrown.
 * @return true if both times were set.
 */
bool normalize_timestamps(const std::filesystem::path& path, Logger& logger);

} // namespace metawipe

#endif // METAWIPE_TIMESTAMP_NORMALIZER_HPP
