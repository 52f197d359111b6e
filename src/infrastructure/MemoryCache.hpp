/**
 * @file MemoryCache.hpp
 * @brief In-process hot tier of the cache.
 */

#pragma once
#include <string>
#include <list>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <chrono>
#include <cstdint>

namespace crawlscope::infrastructure {

/**
 * @class MemoryCache
 * @brief Byte-bounded LRU map from cache key hash to value.
 *
 * Entries remember their expiry so the hot tier never serves a value the
 * persistent tier would already treat as expired. A budget of 0 disables it.
 */
class MemoryCache {
public:
    explicit MemoryCache(uint64_t maxBytes);

    /** @brief Returns the value and marks it most recently used. */
    std::optional<std::string> get(const std::string& keyHash);

    /** @brief Inserts or replaces a value expiring after @p ttlSeconds. */
    void put(const std::string& keyHash, const std::string& value, int ttlSeconds);

    void erase(const std::string& keyHash);
    void clear();

    size_t entryCount() const;
    uint64_t sizeBytes() const;

private:
    struct Entry {
        std::string keyHash;
        std::string value;
        std::chrono::steady_clock::time_point expiresAt;
    };
    using EntryList = std::list<Entry>;

    void eraseLocked(EntryList::iterator it);

    const uint64_t m_maxBytes;
    uint64_t m_sizeBytes = 0;
    EntryList m_entries; ///< Front is most recently used.
    std::unordered_map<std::string, EntryList::iterator> m_index;
    mutable std::mutex m_mutex;
};

} // namespace crawlscope::infrastructure
