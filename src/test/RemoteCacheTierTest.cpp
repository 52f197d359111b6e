#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

#include "infrastructure/CacheManager.hpp"
#include "infrastructure/HttpRemoteCacheTier.hpp"

using namespace crawlscope::infrastructure;

namespace {

// Key/value store behind "/kv/cc:<hash>", recording every request it sees
struct SharedStore {
    std::mutex mutex;
    std::map<std::string, std::string> values;
    std::vector<std::string> requests; ///< "METHOD path"
    std::map<std::string, int> ttls;
    std::atomic<bool> failing{false};

    void record(const httplib::Request& req) {
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(req.method + " " + req.path);
    }

    size_t requestCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests.size();
    }
};

CacheOptions OptionsFor(const std::filesystem::path& dir) {
    CacheOptions options;
    options.directory = dir.string();
    options.maxSizeBytes = 1024 * 1024;
    options.memoryBytes = 0;
    return options;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RemoteCacheTier Test..." << std::endl;

    SharedStore store;
    httplib::Server svr;

    svr.Get(R"(/kv/cc:([0-9a-f]*))", [&](const httplib::Request& req, httplib::Response& res) {
        store.record(req);
        if (store.failing) {
            res.status = 500;
            return;
        }
        std::lock_guard<std::mutex> lock(store.mutex);
        auto it = store.values.find(req.matches[1]);
        if (it == store.values.end()) {
            res.status = 404;
            return;
        }
        res.set_content(it->second, "application/octet-stream");
    });

    svr.Put(R"(/kv/cc:([0-9a-f]*))", [&](const httplib::Request& req, httplib::Response& res) {
        store.record(req);
        if (store.failing) {
            res.status = 500;
            return;
        }
        std::lock_guard<std::mutex> lock(store.mutex);
        store.values[req.matches[1]] = req.body;
        store.ttls[req.matches[1]] = std::stoi(req.get_param_value("ttl"));
        res.status = 204;
    });

    svr.Delete(R"(/kv/cc:)", [&](const httplib::Request& req, httplib::Response& res) {
        store.record(req);
        std::lock_guard<std::mutex> lock(store.mutex);
        store.values.clear();
        res.status = 204;
    });

    const int port = svr.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread serverThread([&]() { svr.listen_after_bind(); });
    svr.wait_until_ready();

    const std::string url = "http://127.0.0.1:" + std::to_string(port) + "/kv";
    const auto testRoot = std::filesystem::temp_directory_path() / "crawlscope_remote_tier_test";
    std::filesystem::remove_all(testRoot);

    // Tier requests address the hashed key under the configured prefix
    {
        HttpRemoteCacheTier tier(url, 2);
        const std::string hash = CacheManager::HashKey("direct");
        assert(!tier.get(hash).has_value());

        tier.set(hash, std::string("bin\0ary", 7), 120);
        auto value = tier.get(hash);
        assert(value.has_value());
        assert(*value == std::string("bin\0ary", 7));
        {
            std::lock_guard<std::mutex> lock(store.mutex);
            assert(store.ttls.at(hash) == 120);
            assert(store.requests.front() == "GET /kv/cc:" + hash);
            assert(store.requests[1] == "PUT /kv/cc:" + hash);
        }

        store.failing = true;
        bool threw = false;
        try {
            tier.get(hash);
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find("500") != std::string::npos;
        }
        assert(threw);
        store.failing = false;
    }
    std::cout << "[PASS] Remote tier speaks GET/PUT on hashed keys." << std::endl;

    // Two caches on different directories share entries through the remote tier
    {
        CacheOptions writerOptions = OptionsFor(testRoot / "writer");
        writerOptions.remoteTtlSeconds = 60;
        CacheManager writer(writerOptions, std::make_shared<HttpRemoteCacheTier>(url, 2));
        writer.set("report:example.com", "shared payload", 3600);
        writer.set("report:short", "short lived", 30);

        const std::string hash = CacheManager::HashKey("report:example.com");
        {
            std::lock_guard<std::mutex> lock(store.mutex);
            assert(store.values.at(hash) == "shared payload");
            assert(store.ttls.at(hash) == 60);
            assert(store.ttls.at(CacheManager::HashKey("report:short")) == 30);
        }

        CacheManager reader(OptionsFor(testRoot / "reader"), std::make_shared<HttpRemoteCacheTier>(url, 2));
        auto shared = reader.get("report:example.com");
        assert(shared.has_value());
        assert(*shared == "shared payload");

        assert(!reader.get("report:unknown").has_value());
        assert(reader.stats().misses == 1);
        assert(reader.stats().hits == 1);
    }
    std::cout << "[PASS] Entries written by one cache are read by another." << std::endl;

    // Server errors count as remote misses and local tiers keep serving
    {
        CacheManager cache(OptionsFor(testRoot / "degraded"), std::make_shared<HttpRemoteCacheTier>(url, 2));
        cache.set("local-key", "local value");

        store.failing = true;
        const size_t before = store.requestCount();
        auto value = cache.get("local-key");
        assert(value.has_value());
        assert(*value == "local value");
        assert(store.requestCount() > before);
        assert(!cache.get("missing-key").has_value());
        cache.set("written-while-down", "kept locally");
        assert(*cache.get("written-while-down") == "kept locally");
        store.failing = false;
    }
    std::cout << "[PASS] Remote server errors degrade to local reads." << std::endl;

    // Clearing a cache clears the shared tier
    {
        CacheManager cache(OptionsFor(testRoot / "clearing"), std::make_shared<HttpRemoteCacheTier>(url, 2));
        cache.set("to-clear", "gone soon");
        cache.clear();
        {
            std::lock_guard<std::mutex> lock(store.mutex);
            assert(store.requests.back() == "DELETE /kv/cc:");
            assert(store.values.empty());
        }
        assert(!cache.get("to-clear").has_value());
    }
    std::cout << "[PASS] Clear sends a prefix delete." << std::endl;

    svr.stop();
    serverThread.join();

    // A stopped server is a transport failure
    {
        HttpRemoteCacheTier tier(url, 1);
        bool threw = false;
        try {
            tier.set(CacheManager::HashKey("offline"), "value", 10);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        CacheManager cache(OptionsFor(testRoot / "offline"), std::make_shared<HttpRemoteCacheTier>(url, 1));
        cache.set("offline-key", "still cached");
        assert(*cache.get("offline-key") == "still cached");
    }
    std::cout << "[PASS] Unreachable remote tier is tolerated." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
