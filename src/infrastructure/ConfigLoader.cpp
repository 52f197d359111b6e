/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <iostream>

namespace crawlscope::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

const char* Env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template <typename Apply>
void ParseEnv(const char* name, Apply apply) {
    const char* value = Env(name);
    if (!value) return;
    try {
        apply(value);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring malformed " << name << "=" << value << ": " << e.what() << std::endl;
    }
}

} // namespace

uint64_t AppConfig::maxCacheBytes() const {
    return static_cast<uint64_t>(cache.maxSizeGb * 1024.0 * 1024.0 * 1024.0);
}

uint64_t AppConfig::memoryCacheBytes() const {
    return static_cast<uint64_t>(cache.memoryCacheMb) * 1024ULL * 1024ULL;
}

std::string AppConfig::resolvedCacheDir() const {
    if (!cache.cacheDir.empty()) {
        return cache.cacheDir;
    }
    return (PathUtils::GetCacheHome() / "crawlscope").string();
}

std::vector<std::string> AppConfig::validate() const {
    std::vector<std::string> problems;
    if (cache.maxSizeGb < 1.0 || cache.maxSizeGb > 1000.0) {
        problems.push_back("cache.maxSizeGb must be between 1 and 1000");
    }
    if (cache.memoryCacheMb < 64 || cache.memoryCacheMb > 8192) {
        problems.push_back("cache.memoryCacheMb must be between 64 and 8192");
    }
    if (cache.defaultTtlSeconds < 300) {
        problems.push_back("cache.defaultTtlSeconds must be at least 300");
    }
    if (rateLimit.maxConcurrentRequests < 1 || rateLimit.maxConcurrentRequests > 50) {
        problems.push_back("rateLimit.maxConcurrentRequests must be between 1 and 50");
    }
    if (rateLimit.requestsPerSecond < 1.0 || rateLimit.requestsPerSecond > 100.0) {
        problems.push_back("rateLimit.requestsPerSecond must be between 1 and 100");
    }
    if (index.timeoutSeconds < 5 || index.timeoutSeconds > 120) {
        problems.push_back("index.timeoutSeconds must be between 5 and 120");
    }
    if (index.maxResults < 10 || index.maxResults > 10000) {
        problems.push_back("index.maxResults must be between 10 and 10000");
    }
    if (objectStore.costPerGbUsd < 0.0) {
        problems.push_back("objectStore.costPerGbUsd must not be negative");
    }
    if (remoteCache.enabled && remoteCache.url.empty()) {
        problems.push_back("remoteCache.enabled is set but remoteCache.url is empty");
    }
    if (aggregation.fanOutWidth < 1 || aggregation.timelineFanOutWidth < 1) {
        problems.push_back("aggregation fan-out widths must be positive");
    }
    return problems;
}

AppConfig ConfigLoader::Load(const std::string& projectRoot) {
    AppConfig config;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";

    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            nlohmann::json j;
            f >> j;

            if (j.contains("cache")) {
                const auto& s = j["cache"];
                ReadKey(s, "cacheDir", config.cache.cacheDir);
                ReadKey(s, "maxSizeGb", config.cache.maxSizeGb);
                ReadKey(s, "memoryCacheMb", config.cache.memoryCacheMb);
                ReadKey(s, "defaultTtlSeconds", config.cache.defaultTtlSeconds);
            }
            if (j.contains("objectStore")) {
                const auto& s = j["objectStore"];
                ReadKey(s, "endpoint", config.objectStore.endpoint);
                ReadKey(s, "bucket", config.objectStore.bucket);
                ReadKey(s, "costPerGbUsd", config.objectStore.costPerGbUsd);
                ReadKey(s, "timeoutSeconds", config.objectStore.timeoutSeconds);
            }
            if (j.contains("rateLimit")) {
                const auto& s = j["rateLimit"];
                ReadKey(s, "maxConcurrentRequests", config.rateLimit.maxConcurrentRequests);
                ReadKey(s, "requestsPerSecond", config.rateLimit.requestsPerSecond);
            }
            if (j.contains("index")) {
                const auto& s = j["index"];
                ReadKey(s, "serverUrl", config.index.serverUrl);
                ReadKey(s, "timeoutSeconds", config.index.timeoutSeconds);
                ReadKey(s, "maxResults", config.index.maxResults);
                ReadKey(s, "defaultSnapshot", config.index.defaultSnapshot);
            }
            if (j.contains("remoteCache")) {
                const auto& s = j["remoteCache"];
                ReadKey(s, "url", config.remoteCache.url);
                ReadKey(s, "enabled", config.remoteCache.enabled);
                ReadKey(s, "ttlSeconds", config.remoteCache.ttlSeconds);
            }
            if (j.contains("aggregation")) {
                const auto& s = j["aggregation"];
                ReadKey(s, "fanOutWidth", config.aggregation.fanOutWidth);
                ReadKey(s, "timelineFanOutWidth", config.aggregation.timelineFanOutWidth);
                ReadKey(s, "reportTtlSeconds", config.aggregation.reportTtlSeconds);
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        }
    }

    ApplyEnvironment(config);
    return config;
}

void ConfigLoader::ApplyEnvironment(AppConfig& config) {
    if (const char* v = Env("CACHE_DIR")) config.cache.cacheDir = v;
    if (const char* v = Env("CDX_SERVER_URL")) config.index.serverUrl = v;
    if (const char* v = Env("COMMONCRAWL_BUCKET")) config.objectStore.bucket = v;
    if (const char* v = Env("S3_ENDPOINT")) config.objectStore.endpoint = v;
    if (const char* v = Env("REMOTE_CACHE_URL")) {
        config.remoteCache.url = v;
        config.remoteCache.enabled = true;
    }

    ParseEnv("CACHE_MAX_SIZE_GB", [&](const char* v) { config.cache.maxSizeGb = std::stod(v); });
    ParseEnv("MAX_CONCURRENT_REQUESTS", [&](const char* v) { config.rateLimit.maxConcurrentRequests = std::stoi(v); });
    ParseEnv("REQUESTS_PER_SECOND", [&](const char* v) { config.rateLimit.requestsPerSecond = std::stod(v); });
}

void ConfigLoader::Save(const std::string& projectRoot, const AppConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j;

    // Keep keys this version does not know about
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["cache"] = {
        {"cacheDir", config.cache.cacheDir},
        {"maxSizeGb", config.cache.maxSizeGb},
        {"memoryCacheMb", config.cache.memoryCacheMb},
        {"defaultTtlSeconds", config.cache.defaultTtlSeconds}
    };
    j["objectStore"] = {
        {"endpoint", config.objectStore.endpoint},
        {"bucket", config.objectStore.bucket},
        {"costPerGbUsd", config.objectStore.costPerGbUsd},
        {"timeoutSeconds", config.objectStore.timeoutSeconds}
    };
    j["rateLimit"] = {
        {"maxConcurrentRequests", config.rateLimit.maxConcurrentRequests},
        {"requestsPerSecond", config.rateLimit.requestsPerSecond}
    };
    j["index"] = {
        {"serverUrl", config.index.serverUrl},
        {"timeoutSeconds", config.index.timeoutSeconds},
        {"maxResults", config.index.maxResults},
        {"defaultSnapshot", config.index.defaultSnapshot}
    };
    j["remoteCache"] = {
        {"url", config.remoteCache.url},
        {"enabled", config.remoteCache.enabled},
        {"ttlSeconds", config.remoteCache.ttlSeconds}
    };
    j["aggregation"] = {
        {"fanOutWidth", config.aggregation.fanOutWidth},
        {"timelineFanOutWidth", config.aggregation.timelineFanOutWidth},
        {"reportTtlSeconds", config.aggregation.reportTtlSeconds}
    };

    try {
        std::filesystem::create_directories(projectRoot);
        std::ofstream f(configPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
}

} // namespace crawlscope::infrastructure
