/**
 * @file ConfigLoader.hpp
 * @brief Loading/saving of the application configuration (settings.json).
 *
 * Values come from defaults, then settings.json in the project root, then
 * environment variables, in that order of precedence.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace crawlscope::infrastructure {

struct CacheConfig {
    std::string cacheDir; ///< Empty means <XDG cache home>/crawlscope.
    double maxSizeGb = 50.0;
    int memoryCacheMb = 512;
    int defaultTtlSeconds = 86400;
};

struct ObjectStoreConfig {
    std::string endpoint = "https://s3.us-east-1.amazonaws.com";
    std::string bucket = "commoncrawl";
    double costPerGbUsd = 0.09;
    int timeoutSeconds = 120;
};

struct RateLimitConfig {
    int maxConcurrentRequests = 5;
    double requestsPerSecond = 10.0;
};

struct IndexConfig {
    std::string serverUrl = "https://index.commoncrawl.org";
    int timeoutSeconds = 30;
    int maxResults = 1000;
    std::string defaultSnapshot = "CC-MAIN-2024-10";
};

struct RemoteCacheConfig {
    std::string url;
    bool enabled = false;
    int ttlSeconds = 3600;
};

struct AggregationConfig {
    int fanOutWidth = 10;
    int timelineFanOutWidth = 5;
    int reportTtlSeconds = 7 * 24 * 3600;
};

/**
 * @struct AppConfig
 * @brief Complete runtime configuration, built once at startup.
 */
struct AppConfig {
    CacheConfig cache;
    ObjectStoreConfig objectStore;
    RateLimitConfig rateLimit;
    IndexConfig index;
    RemoteCacheConfig remoteCache;
    AggregationConfig aggregation;

    /** @brief Maximum persisted cache size in bytes. */
    uint64_t maxCacheBytes() const;

    /** @brief Hot-set budget in bytes. */
    uint64_t memoryCacheBytes() const;

    /** @brief Cache directory with the XDG default applied. */
    std::string resolvedCacheDir() const;

    /**
     * @brief Checks value bounds.
     * @return One message per problem; empty when the configuration is usable.
     */
    std::vector<std::string> validate() const;
};

class ConfigLoader {
public:
    /**
     * @brief Builds the configuration for a project root.
     * @param projectRoot Directory holding settings.json (may not exist).
     */
    static AppConfig Load(const std::string& projectRoot);

    /**
     * @brief Writes the configuration to settings.json, preserving unknown keys.
     */
    static void Save(const std::string& projectRoot, const AppConfig& config);

private:
    static void ApplyEnvironment(AppConfig& config);
};

} // namespace crawlscope::infrastructure
