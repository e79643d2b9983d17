#ifndef METAWIPE_RANDOM_UTILS_HPP
#define METAWIPE_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers for unique temp-file names.
 *
 * The underlying generator (std::mt19937_64) is thread-local.
 */
namespace metawipe::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a short random suffix (lower-case hex of a 64-bit value).
     */
    std::string random_suffix();

} // namespace metawipe::RandomUtils

#endif // METAWIPE_RANDOM_UTILS_HPP
