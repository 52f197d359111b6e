#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>

#include <httplib.h>

#include "infrastructure/ArchiveIndexClient.hpp"

using namespace crawlscope;
using namespace crawlscope::infrastructure;

namespace {

const char* kCollInfo = R"([
  {"id": "CC-MAIN-2023-50", "name": "December 2023 Index"},
  {"id": "CC-MAIN-2024-10", "name": "February/March 2024 Index"},
  {"id": "CC-MAIN-2023-06", "name": "January/February 2023 Index"}
])";

std::string Line(const std::string& url, const std::string& filename, int offset) {
    return "[\"com,example)/\", \"20240301120000\", \"" + url + "\", \"text/html\", \"200\", \"SHA1:ABC\", \"1500\", \"" +
           std::to_string(offset) + "\", \"" + filename + "\"]\n";
}

} // namespace

int main() {
    std::cout << "[Test] Starting ArchiveIndexClient Test..." << std::endl;

    httplib::Server svr;
    std::atomic<int> streamRequests{0};
    std::string lastMatchType;

    svr.Get("/collinfo.json", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(kCollInfo, "application/json");
    });

    svr.Get(R"(/(CC-MAIN-[0-9]+-[0-9]+)-index)", [&](const httplib::Request& req, httplib::Response& res) {
        const std::string snapshot = req.matches[1];
        if (snapshot != "CC-MAIN-2024-10") {
            res.status = 404;
            return;
        }
        lastMatchType = req.has_param("matchType") ? req.get_param_value("matchType") : "";

        if (req.has_param("page")) {
            ++streamRequests;
            const std::string page = req.get_param_value("page");
            std::string body;
            if (page == "0") {
                body = Line("http://example.com/", "seg-a.warc.gz", 0) +
                       "this is not json\n" +
                       Line("http://example.com/about", "seg-a.warc.gz", 1500);
            } else if (page == "1") {
                body = "{\"url\": \"http://example.com/blog\", \"timestamp\": \"20240302000000\", \"mime\": \"text/html\","
                       " \"status\": \"200\", \"digest\": \"XYZ\", \"length\": \"900\", \"offset\": \"3000\","
                       " \"filename\": \"seg-b.warc.gz\"}\n";
            }
            res.set_content(body, "text/x-ndjson");
            return;
        }

        const std::string url = req.get_param_value("url");
        if (url == "http://example.com/") {
            res.set_content(Line("http://example.com/", "seg-a.warc.gz", 0), "text/x-ndjson");
        } else {
            res.set_content("", "text/x-ndjson");
        }
    });

    const int port = svr.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread serverThread([&]() { svr.listen_after_bind(); });
    svr.wait_until_ready();

    IndexConfig config;
    config.serverUrl = "http://127.0.0.1:" + std::to_string(port);
    config.timeoutSeconds = 5;
    ArchiveIndexClient client(config, std::make_shared<RequestThrottle>(2, 0.0));

    // Snapshots
    auto snapshots = client.listSnapshots();
    assert(snapshots.size() == 3);
    assert(snapshots[1].id == "CC-MAIN-2024-10");
    assert(snapshots[1].name == "February/March 2024 Index");
    assert(client.latestSnapshot() == std::optional<std::string>("CC-MAIN-2024-10"));
    assert(client.resolveSnapshot(std::nullopt) == "CC-MAIN-2024-10");
    assert(client.resolveSnapshot(std::string("CC-MAIN-2020-05")) == "CC-MAIN-2020-05");
    std::cout << "[PASS] Snapshot listing and latest selection." << std::endl;

    // Search
    auto hits = client.search("http://example.com/", std::string("CC-MAIN-2024-10"), 10, domain::MatchType::Exact);
    assert(hits.size() == 1);
    assert(hits[0].url == "http://example.com/");
    assert(hits[0].statusCode == 200);
    assert(hits[0].length == 1500);
    assert(hits[0].segmentFilename == "seg-a.warc.gz");
    assert(lastMatchType.empty());

    auto latestHits = client.search("http://example.com/", std::nullopt, 10, domain::MatchType::Prefix);
    assert(latestHits.size() == 1);
    assert(lastMatchType == "prefix");

    assert(client.search("http://nothing.example/", std::string("CC-MAIN-2024-10"), 10, domain::MatchType::Exact).empty());
    assert(client.search("http://example.com/", std::string("CC-MAIN-1999-01"), 10, domain::MatchType::Exact).empty());
    assert(client.search("http://example.com/", std::string("CC-MAIN-2024-10"), 0, domain::MatchType::Exact).empty());
    std::cout << "[PASS] Search results, empty matches and missing snapshots." << std::endl;

    // Domain stream: malformed lines skipped, ends on the first empty page
    {
        auto stream = client.streamDomain("example.com", "CC-MAIN-2024-10");
        auto records = stream.collect();
        assert(records.size() == 3);
        assert(records[0].url == "http://example.com/");
        assert(records[1].url == "http://example.com/about");
        assert(records[2].url == "http://example.com/blog");
        assert(records[2].offset == 3000);
        assert(stream.pagesFetched() == 3);
        assert(lastMatchType == "domain");
    }
    {
        streamRequests = 0;
        auto stream = client.streamDomain("example.com", "CC-MAIN-2024-10", 1);
        auto first = stream.next();
        assert(first && first->url == "http://example.com/");
        assert(!stream.next().has_value());
        assert(streamRequests.load() == 1);
    }
    {
        auto stream = client.streamDomain("example.com", "CC-MAIN-1999-01");
        assert(!stream.next().has_value());
    }
    std::cout << "[PASS] Domain stream paging." << std::endl;

    // Line decoding
    assert(!ArchiveIndexClient::ParseRecordLine("[1, 2, 3]").has_value());
    assert(!ArchiveIndexClient::ParseRecordLine("{\"url\": \"x\"}").has_value());
    auto objectForm = ArchiveIndexClient::ParseRecordLine(
        "{\"url\": \"http://a/\", \"offset\": 5, \"length\": 7, \"filename\": \"f\"}");
    assert(objectForm && objectForm->offset == 5 && objectForm->length == 7 && objectForm->statusCode == 0);

    auto early = ArchiveIndexClient::DecodeSnapshotDate("CC-MAIN-2023-06");
    auto later = ArchiveIndexClient::DecodeSnapshotDate("CC-MAIN-2024-10");
    assert(early < later);
    std::cout << "[PASS] Record line and snapshot date decoding." << std::endl;

    svr.stop();
    serverThread.join();

    // Unreachable server degrades to empty results
    IndexConfig offline;
    offline.serverUrl = "http://127.0.0.1:" + std::to_string(port);
    offline.timeoutSeconds = 1;
    offline.defaultSnapshot = "CC-MAIN-2022-05";
    ArchiveIndexClient down(offline, nullptr);
    assert(down.listSnapshots().empty());
    assert(down.resolveSnapshot(std::nullopt) == "CC-MAIN-2022-05");
    std::cout << "[PASS] Connection failures yield empty results." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
