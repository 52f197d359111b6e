#include <cassert>
#include <iostream>
#include <string>

#include "infrastructure/GzipCodec.hpp"
#include "infrastructure/RecordParser.hpp"

using namespace crawlscope::infrastructure;

namespace {

std::string Record(const std::string& type, const std::string& uri, const std::string& block,
                   size_t declaredLength) {
    std::string head = "WARC/1.0\r\n"
                       "WARC-Type: " + type + "\r\n"
                       "WARC-Record-ID: <urn:uuid:" + type + "-" + std::to_string(block.size()) + ">\r\n"
                       "WARC-Date: 2024-03-01T12:00:00Z\r\n";
    if (!uri.empty()) {
        head += "WARC-Target-URI: " + uri + "\r\n";
    }
    head += "Content-Type: application/http; msgtype=" + type + "\r\n"
            "Content-Length: " + std::to_string(declaredLength) + "\r\n\r\n";
    return head + block + "\r\n\r\n";
}

std::string Record(const std::string& type, const std::string& uri, const std::string& block) {
    return Record(type, uri, block, block.size());
}

const std::string kHttpResponse =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/html\r\n"
    "Server: nginx/1.18\r\n"
    "Strict-Transport-Security: max-age=31536000\r\n"
    "\r\n"
    "<html><body>Hello</body></html>";

} // namespace

int main() {
    std::cout << "[Test] Starting RecordParser Test..." << std::endl;
    RecordParser parser;

    const std::string segment =
        Record("warcinfo", "", "software: crawler\r\n") +
        Record("request", "http://example.com/", "GET / HTTP/1.1\r\nHost: example.com\r\n\r\n") +
        Record("response", "http://example.com/", kHttpResponse) +
        Record("metadata", "http://example.com/", "fetchTimeMs: 120\r\n");

    // Sequential reading
    {
        auto reader = parser.parse(segment);
        auto info = reader.next();
        assert(info && info->recordType == "warcinfo");
        assert(info->targetUri.empty());

        auto request = reader.next();
        assert(request && request->recordType == "request");
        assert(!request->httpHeaders.has_value());

        auto response = reader.next();
        assert(response && response->recordType == "response");
        assert(response->targetUri == "http://example.com/");
        assert(response->date == "2024-03-01T12:00:00Z");
        assert(response->contentLength == kHttpResponse.size());
        assert(response->payload && *response->payload == kHttpResponse);
        assert(response->httpHeaders && response->httpHeaders->at("Server") == "nginx/1.18");

        auto metadata = reader.next();
        assert(metadata && metadata->recordType == "metadata");
        assert(!reader.next().has_value());
        assert(!reader.next().has_value());
        assert(reader.skippedRecords() == 0);
    }
    std::cout << "[PASS] Records are read in order with their headers." << std::endl;

    // Gzip wrapped segments parse the same way
    {
        auto counts = parser.countByType(GzipCodec::Compress(segment));
        assert(counts.size() == 4);
        assert(counts["warcinfo"] == 1 && counts["request"] == 1);
        assert(counts["response"] == 1 && counts["metadata"] == 1);
    }
    std::cout << "[PASS] Gzip segments are inflated before parsing." << std::endl;

    // HTTP reconstruction
    {
        auto record = parser.locate(segment, "http://example.com/");
        assert(record && record->recordType == "request");

        auto reader = parser.parse(segment);
        reader.next();
        reader.next();
        auto responseRecord = reader.next();
        auto response = parser.toHttpResponse(*responseRecord);
        assert(response);
        assert(response->statusCode == 200);
        assert(!response->statusInferred);
        assert(response->headers.at("Content-Type") == "text/html");
        assert(response->headers.at("Strict-Transport-Security") == "max-age=31536000");
        assert(response->body == "<html><body>Hello</body></html>");

        assert(!parser.toHttpResponse(*record).has_value());
        assert(!parser.locate(segment, "http://example.com/missing").has_value());
    }
    {
        const std::string notFound = "HTTP/1.1 404 Not Found\nContent-Type: text/plain\n\nmissing";
        auto reader = parser.parse(Record("response", "http://example.com/x", notFound));
        auto response = parser.toHttpResponse(*reader.next());
        assert(response && response->statusCode == 404);
        assert(response->body == "missing");
    }
    {
        auto reader = parser.parse(Record("response", "http://example.com/raw", "no header boundary here"));
        auto response = parser.toHttpResponse(*reader.next());
        assert(response);
        assert(response->statusCode == 200);
        assert(response->statusInferred);
        assert(response->body == "no header boundary here");
    }
    {
        auto reader = parser.parse(Record("response", "http://example.com/garbled", "GARBAGE LINE\r\nX-A: 1\r\n\r\nbody"));
        auto response = parser.toHttpResponse(*reader.next());
        assert(response && response->statusInferred && response->statusCode == 200);
        assert(response->headers.at("X-A") == "1");
        assert(response->body == "body");
    }
    std::cout << "[PASS] Status, headers and body are recovered from responses." << std::endl;

    // Malformed and truncated input
    {
        const std::string broken =
            "WARC/1.0\r\nWARC-Type: response\r\nContent-Length: abc\r\n\r\njunk\r\n\r\n" +
            Record("metadata", "http://example.com/", "ok");
        auto reader = parser.parse(broken);
        auto record = reader.next();
        assert(record && record->recordType == "metadata");
        assert(reader.skippedRecords() == 1);
        assert(!reader.next().has_value());
    }
    {
        std::string full = Record("response", "http://example.com/", kHttpResponse);
        const std::string truncated = Record("warcinfo", "", "x") + full.substr(0, full.size() - 20);
        auto counts = parser.countByType(truncated);
        assert(counts.size() == 1 && counts["warcinfo"] == 1);

        auto reader = parser.parse(truncated);
        while (reader.next()) {
        }
        assert(reader.skippedRecords() == 1);
    }
    {
        // Oversized Content-Length in the middle of a segment
        const std::string segmentWithHole =
            Record("response", "http://a/", "HTTP/1.1 200 OK\r\n\r\nA") +
            Record("response", "http://corrupt/", "HTTP/1.1 200 OK\r\n\r\nX", 999999) +
            Record("response", "http://c/", "HTTP/1.1 200 OK\r\n\r\nC") +
            Record("metadata", "http://d/", "fetchTimeMs: 5\r\n");
        auto counts = parser.countByType(segmentWithHole);
        assert(counts["response"] == 2);
        assert(counts["metadata"] == 1);

        auto located = parser.locate(segmentWithHole, "http://c/");
        assert(located && located->recordType == "response");
        assert(parser.toHttpResponse(*located)->body == "C");

        auto reader = parser.parse(segmentWithHole);
        int read = 0;
        while (reader.next()) ++read;
        assert(read == 3);
        assert(reader.skippedRecords() == 1);
    }
    {
        // Content-Length too large but still inside the segment
        const std::string block = "HTTP/1.1 200 OK\r\n\r\nshort";
        const std::string overlapping =
            Record("response", "http://a/", block, block.size() + 40) +
            Record("response", "http://b/", "HTTP/1.1 200 OK\r\n\r\n" + std::string(200, 'b')) +
            Record("metadata", "http://b/", "fetchTimeMs: 5\r\n");
        auto reader = parser.parse(overlapping);
        auto first = reader.next();
        assert(first && first->targetUri == "http://b/" && first->recordType == "response");
        auto second = reader.next();
        assert(second && second->recordType == "metadata");
        assert(!reader.next().has_value());
        assert(reader.skippedRecords() == 1);
    }
    assert(parser.countByType("").empty());
    std::cout << "[PASS] Records with a bad Content-Length are skipped and reading resumes." << std::endl;

    // Header block parsing keeps case, last occurrence wins
    {
        auto headers = RecordParser::ParseHeaderBlock("HTTP/1.1 200 OK\r\nSet-Cookie: a=1\r\nSet-Cookie: b=2\r\nNoColon\r\n");
        assert(headers.size() == 1);
        assert(headers.at("Set-Cookie") == "b=2");
    }
    std::cout << "[PASS] Header block parsing." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
