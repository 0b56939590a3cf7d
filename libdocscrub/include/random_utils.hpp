//
// random_utils.hpp
//

#ifndef DOCSCRUB_RANDOM_UTILS_HPP
#define DOCSCRUB_RANDOM_UTILS_HPP

#include <random>
#include <string>

/**
 * @brief Thread-local random helpers used to name temporary workspaces
 * and staging files.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a 16 character lowercase hex suffix.
     */
    std::string random_suffix();

} // namespace RandomUtils

#endif // DOCSCRUB_RANDOM_UTILS_HPP
