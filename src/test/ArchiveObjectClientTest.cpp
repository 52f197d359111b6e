#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <thread>

#include <httplib.h>

#include "infrastructure/ArchiveObjectClient.hpp"
#include "infrastructure/GzipCodec.hpp"

using namespace crawlscope::infrastructure;

namespace {

std::string Payload(size_t size) {
    std::string data;
    data.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        data.push_back(static_cast<char>('a' + (i * 7) % 26));
    }
    return data;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveObjectClient Test..." << std::endl;

    const std::string plain = Payload(200000);
    const std::string gzipped = GzipCodec::Compress(plain);
    // Two gzip members back to back, as in segment files
    const std::string multiMember = GzipCodec::Compress(plain.substr(0, 1000)) + GzipCodec::Compress(plain.substr(1000));

    std::map<std::string, std::string> objects = {
        {"crawl-data/plain.bin", plain},
        {"crawl-data/data.gz", gzipped},
        {"crawl-data/multi.gz", multiMember},
        {"crawl-data/small.txt", "0123456789"}
    };

    httplib::Server svr;
    svr.Get(R"(/commoncrawl/(.*))", [&](const httplib::Request& req, httplib::Response& res) {
        const std::string key = req.matches[1];
        if (key == "crawl-data/forbidden") {
            res.status = 403;
            return;
        }
        auto it = objects.find(key);
        if (it == objects.end()) {
            res.status = 404;
            return;
        }
        res.set_content(it->second, "application/octet-stream");
    });

    const int port = svr.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread serverThread([&]() { svr.listen_after_bind(); });
    svr.wait_until_ready();

    ObjectStoreConfig config;
    config.endpoint = "http://127.0.0.1:" + std::to_string(port);
    config.bucket = "commoncrawl";
    config.timeoutSeconds = 5;
    config.costPerGbUsd = 0.09;
    ArchiveObjectClient client(config, std::make_shared<RequestThrottle>(3, 0.0));

    // Existence and size checks
    assert(client.exists("crawl-data/small.txt"));
    assert(!client.exists("crawl-data/nope"));
    assert(!client.exists("crawl-data/forbidden"));
    assert(client.size("crawl-data/small.txt") == std::optional<uint64_t>(10));
    assert(client.size("crawl-data/plain.bin") == std::optional<uint64_t>(plain.size()));
    assert(!client.size("crawl-data/nope").has_value());
    assert(client.bytesTransferred() == 0);
    std::cout << "[PASS] Range requests report existence and size." << std::endl;

    // Downloads
    auto whole = client.download("crawl-data/small.txt");
    assert(whole && *whole == "0123456789");
    assert(!client.download("crawl-data/nope").has_value());

    auto range = client.downloadRange("crawl-data/small.txt", 2, 5);
    assert(range && *range == "2345");
    auto single = client.downloadRange("crawl-data/small.txt", 9, 9);
    assert(single && *single == "9");
    assert(!client.downloadRange("crawl-data/small.txt", 5, 2).has_value());

    auto inflated = client.downloadAndDecompress("crawl-data/data.gz");
    assert(inflated && *inflated == plain);
    auto passthrough = client.downloadAndDecompress("crawl-data/small.txt");
    assert(passthrough && *passthrough == "0123456789");
    std::cout << "[PASS] Whole, ranged and decompressed downloads." << std::endl;

    // Cost tracking
    const uint64_t transferred = client.bytesTransferred();
    assert(transferred == 10 + 4 + 1 + gzipped.size() + 10);
    const double expected = static_cast<double>(transferred) / (1024.0 * 1024.0 * 1024.0) * 0.09;
    assert(std::fabs(client.estimatedCostUsd() - expected) < 1e-12);
    client.resetCostTracking();
    assert(client.bytesTransferred() == 0);
    assert(client.estimatedCostUsd() == 0.0);
    std::cout << "[PASS] Transfer cost estimate." << std::endl;

    // Streaming
    {
        std::string received;
        bool ok = client.stream("crawl-data/plain.bin", [&](std::string_view chunk) {
            received.append(chunk.data(), chunk.size());
            return true;
        });
        assert(ok);
        assert(received == plain);
    }
    {
        std::string received;
        bool ok = client.streamDecompressed("crawl-data/multi.gz", [&](std::string_view chunk) {
            received.append(chunk.data(), chunk.size());
            return true;
        });
        assert(ok);
        assert(received == plain);
    }
    {
        std::string received;
        bool ok = client.streamDecompressed("crawl-data/small.txt", [&](std::string_view chunk) {
            received.append(chunk.data(), chunk.size());
            return true;
        });
        assert(ok);
        assert(received == "0123456789");
    }
    {
        size_t chunks = 0;
        bool ok = client.stream("crawl-data/plain.bin", [&](std::string_view) {
            ++chunks;
            return false;
        });
        assert(ok);
        assert(chunks == 1);
    }
    {
        bool called = false;
        bool ok = client.stream("crawl-data/nope", [&](std::string_view) {
            called = true;
            return true;
        });
        assert(!ok);
        assert(!called);
    }
    std::cout << "[PASS] Streaming with and without decompression." << std::endl;

    svr.stop();
    serverThread.join();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
