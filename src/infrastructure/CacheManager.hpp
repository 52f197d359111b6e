/**
 * @file CacheManager.hpp
 * @brief Three-tier cache: in-process hot set, optional shared remote tier,
 *        and a persistent sharded blob store with SQLite metadata.
 */

#pragma once
#include <string>
#include <optional>
#include <memory>
#include <mutex>
#include <atomic>
#include <filesystem>
#include <cstdint>
#include "infrastructure/MemoryCache.hpp"
#include "infrastructure/CacheMetadataStore.hpp"
#include "infrastructure/RemoteCacheTier.hpp"

namespace crawlscope::infrastructure {

struct CacheOptions {
    std::string directory;
    uint64_t maxSizeBytes = 50ULL * 1024 * 1024 * 1024;
    uint64_t memoryBytes = 512ULL * 1024 * 1024; ///< 0 disables the hot set.
    int defaultTtlSeconds = 86400;
    int remoteTtlSeconds = 3600; ///< Upper bound on TTLs pushed to the remote tier.
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hitRatePercent = 0.0;
    uint64_t evictions = 0;
    uint64_t entryCount = 0;
    uint64_t sizeBytes = 0;
    uint64_t maxSizeBytes = 0;
    uint64_t memoryEntries = 0;
};

/**
 * @class CacheManager
 * @brief Advisory cache shared by all fetch and aggregation paths.
 *
 * Tiers are read fastest first and a hit refills the faster tiers. Writes go
 * to every tier. The persistent tier expires entries lazily on read and, after
 * each write, evicts the least recently accessed 10% of entries (at least one)
 * while its total size is over the limit.
 *
 * No failure inside the cache reaches the caller: remote errors, SQLite
 * errors and missing or orphaned blobs all degrade to a miss.
 */
class CacheManager {
public:
    /**
     * @throws std::runtime_error if the directory cannot be created or the
     *         bounds are invalid.
     */
    CacheManager(const CacheOptions& options, std::shared_ptr<RemoteCacheTier> remote = nullptr);

    std::optional<std::string> get(const std::string& key);

    /** @param ttlSeconds Defaults to the configured TTL. */
    void set(const std::string& key, const std::string& value, std::optional<int> ttlSeconds = std::nullopt);

    void clear();

    CacheStats stats() const;

    /** @brief Deterministic digest used to address @p key in every tier. */
    static std::string HashKey(const std::string& key);

    /** @brief Blob location of @p keyHash relative to the cache root. */
    static std::string BlobRelativePath(const std::string& keyHash);

    const std::filesystem::path& directory() const { return m_directory; }

private:
    std::optional<std::string> readPersistent(const std::string& keyHash, int& remainingTtl);
    void writePersistent(const std::string& keyHash, const std::string& value, int ttlSeconds);
    void evictIfNeeded();
    void removeBlob(const std::string& relativePath) const;
    void remoteSet(const std::string& keyHash, const std::string& value, int ttlSeconds);

    CacheOptions m_options;
    std::filesystem::path m_directory;
    MemoryCache m_memory;
    std::unique_ptr<CacheMetadataStore> m_store;
    std::shared_ptr<RemoteCacheTier> m_remote;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_misses{0};
    std::atomic<uint64_t> m_evictions{0};
    std::mutex m_evictionMutex;
};

} // namespace crawlscope::infrastructure
