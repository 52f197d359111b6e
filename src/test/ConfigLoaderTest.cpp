#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

using namespace crawlscope::infrastructure;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    for (const char* name : {"CACHE_DIR", "CACHE_MAX_SIZE_GB", "CDX_SERVER_URL", "COMMONCRAWL_BUCKET", "S3_ENDPOINT",
                             "MAX_CONCURRENT_REQUESTS", "REQUESTS_PER_SECOND", "REMOTE_CACHE_URL"}) {
        unsetenv(name);
    }

    const auto root = std::filesystem::temp_directory_path() / "crawlscope_config_test";
    std::filesystem::remove_all(root);

    // Defaults
    {
        AppConfig config = ConfigLoader::Load(root.string());
        assert(config.validate().empty());
        assert(config.index.serverUrl == "https://index.commoncrawl.org");
        assert(config.objectStore.bucket == "commoncrawl");
        assert(config.maxCacheBytes() == 50ULL * 1024 * 1024 * 1024);
        assert(config.memoryCacheBytes() == 512ULL * 1024 * 1024);
        assert(!config.resolvedCacheDir().empty());
    }
    std::cout << "[PASS] Defaults are valid." << std::endl;

    // File values, then environment overrides
    std::filesystem::create_directories(root);
    {
        nlohmann::json j = {
            {"cache", {{"cacheDir", "/tmp/crawlscope-cache"}, {"maxSizeGb", 2.5}}},
            {"index", {{"defaultSnapshot", "CC-MAIN-2023-50"}, {"maxResults", 500}}},
            {"rateLimit", {{"requestsPerSecond", 4.0}}},
            {"plugins", {{"keep", true}}}
        };
        std::ofstream(root / "settings.json") << j.dump();
    }
    {
        AppConfig config = ConfigLoader::Load(root.string());
        assert(config.resolvedCacheDir() == "/tmp/crawlscope-cache");
        assert(config.cache.maxSizeGb == 2.5);
        assert(config.index.defaultSnapshot == "CC-MAIN-2023-50");
        assert(config.index.maxResults == 500);
        assert(config.rateLimit.requestsPerSecond == 4.0);

        setenv("REQUESTS_PER_SECOND", "7.5", 1);
        setenv("REMOTE_CACHE_URL", "http://127.0.0.1:7379", 1);
        setenv("MAX_CONCURRENT_REQUESTS", "lots", 1);
        AppConfig overridden = ConfigLoader::Load(root.string());
        assert(overridden.rateLimit.requestsPerSecond == 7.5);
        assert(overridden.remoteCache.enabled);
        assert(overridden.remoteCache.url == "http://127.0.0.1:7379");
        assert(overridden.rateLimit.maxConcurrentRequests == 5);
        unsetenv("REQUESTS_PER_SECOND");
        unsetenv("REMOTE_CACHE_URL");
        unsetenv("MAX_CONCURRENT_REQUESTS");
    }
    std::cout << "[PASS] Settings file and environment overrides." << std::endl;

    // Save keeps unknown sections
    {
        AppConfig config = ConfigLoader::Load(root.string());
        config.objectStore.costPerGbUsd = 0.05;
        ConfigLoader::Save(root.string(), config);

        std::ifstream in(root / "settings.json");
        nlohmann::json saved;
        in >> saved;
        assert(saved["plugins"]["keep"] == true);
        assert(saved["objectStore"]["costPerGbUsd"] == 0.05);
        assert(ConfigLoader::Load(root.string()).objectStore.costPerGbUsd == 0.05);
    }
    std::cout << "[PASS] Save round-trips and preserves unknown keys." << std::endl;

    // Validation
    {
        AppConfig config;
        config.cache.maxSizeGb = 0.5;
        config.rateLimit.maxConcurrentRequests = 0;
        config.remoteCache.enabled = true;
        auto problems = config.validate();
        assert(problems.size() == 3);
    }
    std::cout << "[PASS] Out-of-range values are reported." << std::endl;

    std::filesystem::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
