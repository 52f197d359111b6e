#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <thread>

#include <httplib.h>

#include "application/PageFetcher.hpp"
#include "infrastructure/GzipCodec.hpp"

using namespace crawlscope;
using namespace crawlscope::application;
using namespace crawlscope::infrastructure;

namespace {

std::string Record(const std::string& type, const std::string& uri, const std::string& block) {
    return "WARC/1.0\r\n"
           "WARC-Type: " + type + "\r\n"
           "WARC-Target-URI: " + uri + "\r\n"
           "WARC-Date: 2024-03-01T12:00:00Z\r\n"
           "Content-Length: " + std::to_string(block.size()) + "\r\n\r\n" +
           block + "\r\n\r\n";
}

class StaticIndex : public domain::ArchiveIndex {
public:
    std::vector<domain::CrawlSnapshot> listSnapshots() override { return {}; }

    std::vector<domain::IndexRecord> search(const std::string& query,
                                            const std::optional<std::string>& snapshotId,
                                            int,
                                            domain::MatchType) override {
        ++searches;
        auto it = entries.find(snapshotId.value_or("") + "|" + query);
        if (it == entries.end()) return {};
        return {it->second};
    }

    std::optional<std::string> latestSnapshot() override { return std::string("CC-MAIN-2024-10"); }

    std::map<std::string, domain::IndexRecord> entries;
    std::atomic<int> searches{0};
};

} // namespace

int main() {
    std::cout << "[Test] Starting PageFetcher Test..." << std::endl;

    // Segment of independently gzipped records, as the crawl stores them
    const std::string first = GzipCodec::Compress(Record("warcinfo", "", "software: test\r\n"));
    const std::string home = GzipCodec::Compress(Record("response", "https://example.com/",
        "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\nX-Frame-Options: DENY\r\n\r\n<h1>Home</h1>"));
    const std::string moved = GzipCodec::Compress(Record("response", "http://example.com/old",
        "HTTP/1.1 301 Moved Permanently\r\nLocation: /new\r\n\r\n"));
    const std::string segment = first + home + moved;

    httplib::Server svr;
    svr.Get(R"(/commoncrawl/(.*))", [&](const httplib::Request& req, httplib::Response& res) {
        if (std::string(req.matches[1]) != "crawl-data/segment.warc.gz") {
            res.status = 404;
            return;
        }
        res.set_content(segment, "application/octet-stream");
    });
    const int port = svr.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread serverThread([&]() { svr.listen_after_bind(); });
    svr.wait_until_ready();

    auto index = std::make_shared<StaticIndex>();
    auto entry = [](const std::string& url, uint64_t offset, uint64_t length) {
        domain::IndexRecord record;
        record.url = url;
        record.mimeType = "text/html";
        record.statusCode = 200;
        record.captureTimestamp = "20240301120000";
        record.offset = offset;
        record.length = length;
        record.segmentFilename = "crawl-data/segment.warc.gz";
        return record;
    };
    index->entries["CC-MAIN-2024-10|https://example.com/"] = entry("https://example.com/", first.size(), home.size());
    // Index URL differs from the record's target URI
    index->entries["CC-MAIN-2024-10|https://example.com/old"] =
        entry("https://example.com/old", first.size() + home.size(), moved.size());
    index->entries["CC-MAIN-2024-10|https://example.com/lost"] = entry("https://example.com/lost", 0, 0);
    index->entries["CC-MAIN-2024-10|https://example.com/absent"] = [&] {
        auto record = entry("https://example.com/absent", 0, 10);
        record.segmentFilename = "crawl-data/missing.warc.gz";
        return record;
    }();

    ObjectStoreConfig objectConfig;
    objectConfig.endpoint = "http://127.0.0.1:" + std::to_string(port);
    objectConfig.timeoutSeconds = 5;
    auto throttle = std::make_shared<RequestThrottle>(4, 0.0);
    auto objects = std::make_shared<ArchiveObjectClient>(objectConfig, throttle);

    const auto cacheDir = std::filesystem::temp_directory_path() / "crawlscope_fetcher_test";
    std::filesystem::remove_all(cacheDir);
    CacheOptions cacheOptions;
    cacheOptions.directory = cacheDir.string();
    cacheOptions.maxSizeBytes = 1024 * 1024;
    cacheOptions.memoryBytes = 0;
    auto cache = std::make_shared<CacheManager>(cacheOptions);

    PageFetcher fetcher(index, objects, cache, "CC-MAIN-2024-10");

    // Single page
    {
        auto page = fetcher.fetchPage("https://example.com/", "");
        assert(page);
        assert(page->snapshotId == "CC-MAIN-2024-10");
        assert(page->statusCode == 200);
        assert(!page->statusInferred);
        assert(page->headers.at("X-Frame-Options") == "DENY");
        assert(page->body == "<h1>Home</h1>");
        assert(page->mimeType == "text/html");
        assert(page->captureTimestamp == "20240301120000");
        assert(page->length == home.size());
        assert(objects->bytesTransferred() == home.size());
    }
    {
        auto page = fetcher.fetchPage("https://example.com/old", "CC-MAIN-2024-10");
        assert(page && page->statusCode == 301);
        assert(page->headers.at("Location") == "/new");
    }
    assert(!fetcher.fetchPage("https://example.com/nowhere", "CC-MAIN-2024-10").has_value());
    assert(!fetcher.fetchPage("https://example.com/lost", "CC-MAIN-2024-10").has_value());
    assert(!fetcher.fetchPage("https://example.com/absent", "CC-MAIN-2024-10").has_value());
    std::cout << "[PASS] Pages are rebuilt from ranged segment reads." << std::endl;

    // Second read comes from the cache
    {
        const uint64_t before = objects->bytesTransferred();
        const int searchesBefore = index->searches.load();
        auto page = fetcher.fetchPage("https://example.com/", "CC-MAIN-2024-10");
        assert(page && page->body == "<h1>Home</h1>");
        assert(objects->bytesTransferred() == before);
        assert(index->searches.load() == searchesBefore);
    }
    std::cout << "[PASS] Fetched pages are cached." << std::endl;

    // Batch
    {
        auto batch = fetcher.fetchBatch({"https://example.com/", "https://example.com/old",
                                         "https://example.com/nowhere", "https://example.com/"},
                                        "CC-MAIN-2024-10", 2);
        assert(batch.total == 3);
        assert(batch.successful == 2);
        assert(batch.failed == 1);
        assert(batch.pages.count("https://example.com/old") == 1);
        assert((batch.failedUrls == std::vector<std::string>{"https://example.com/nowhere"}));

        auto empty = fetcher.fetchBatch({}, "", 5);
        assert(empty.total == 0 && empty.pages.empty());
    }
    std::cout << "[PASS] Batch fetch deduplicates and reports failures." << std::endl;

    svr.stop();
    serverThread.join();
    std::filesystem::remove_all(cacheDir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
