/**
 * @file CacheMetadataStore.hpp
 * @brief SQLite table describing the persistent cache blobs.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <memory>
#include <cstdint>

struct sqlite3;

namespace crawlscope::infrastructure {

/**
 * @struct CacheEntryMeta
 * @brief One row of cache_metadata. Times are seconds since the Unix epoch.
 */
struct CacheEntryMeta {
    std::string keyHash;
    std::string filename; ///< Blob path relative to the cache root.
    uint64_t sizeBytes = 0;
    double createdAt = 0.0;
    double lastAccessed = 0.0;
    int64_t accessCount = 0;
    int ttlSeconds = 0;

    bool isExpired(double now) const { return now - createdAt > ttlSeconds; }
};

/**
 * @class CacheMetadataStore
 * @brief Per-key autocommit access to the cache metadata database.
 *
 * Every call opens its own connection (WAL journal, busy timeout), so callers
 * on different threads never share a handle. Failures throw
 * std::runtime_error.
 */
class CacheMetadataStore {
public:
    /** @brief Opens (creating if needed) the database and its schema. */
    explicit CacheMetadataStore(std::filesystem::path dbPath);

    std::optional<CacheEntryMeta> find(const std::string& keyHash) const;

    /** @brief Inserts or replaces the row for @p entry.keyHash. */
    void upsert(const CacheEntryMeta& entry) const;

    /** @brief Records a read: bumps the access count and access time. */
    void touch(const std::string& keyHash, double now) const;

    void remove(const std::string& keyHash) const;
    void removeAll() const;

    uint64_t totalSize() const;
    uint64_t entryCount() const;

    /** @brief The @p limit rows with the oldest access time, oldest first. */
    std::vector<CacheEntryMeta> leastRecentlyAccessed(uint64_t limit) const;

    const std::filesystem::path& path() const { return m_dbPath; }

private:
    struct ConnectionCloser {
        void operator()(sqlite3* db) const;
    };
    using Connection = std::unique_ptr<sqlite3, ConnectionCloser>;

    Connection open() const;

    std::filesystem::path m_dbPath;
};

} // namespace crawlscope::infrastructure
