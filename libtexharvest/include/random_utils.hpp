#ifndef TEXHARVEST_RANDOM_UTILS_HPP
#define TEXHARVEST_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers used to name temporary directories.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a random hexadecimal suffix for unique names.
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // TEXHARVEST_RANDOM_UTILS_HPP
