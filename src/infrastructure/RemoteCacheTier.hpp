/**
 * @file RemoteCacheTier.hpp
 * @brief Shared cache tier reachable by several processes.
 */

#pragma once
#include <string>
#include <optional>

namespace crawlscope::infrastructure {

/**
 * @class RemoteCacheTier
 * @brief Abstract key/value store keyed by cache key hash.
 *
 * Implementations may throw on any transport failure; CacheManager treats
 * every exception from this tier as a miss.
 */
class RemoteCacheTier {
public:
    virtual ~RemoteCacheTier() = default;

    virtual std::optional<std::string> get(const std::string& keyHash) = 0;
    virtual void set(const std::string& keyHash, const std::string& value, int ttlSeconds) = 0;
    virtual void clear() = 0;
};

} // namespace crawlscope::infrastructure
