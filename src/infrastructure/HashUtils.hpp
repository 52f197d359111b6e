/**
 * @file HashUtils.hpp
 * @brief Digest helpers for cache keys.
 */

#pragma once
#include <string>
#include <string_view>

namespace crawlscope::infrastructure {

class HashUtils {
public:
    /** @brief Lowercase hex SHA-256 of @p data (64 characters). */
    static std::string Sha256Hex(std::string_view data);
};

} // namespace crawlscope::infrastructure
