#include "infrastructure/RecordParser.hpp"
#include "infrastructure/GzipCodec.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace crawlscope::infrastructure {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string Trim(std::string_view value) {
    size_t begin = value.find_first_not_of(" \t");
    if (begin == std::string_view::npos) return "";
    size_t end = value.find_last_not_of(" \t\r");
    return std::string(value.substr(begin, end - begin + 1));
}

/** Locates the end of an HTTP header block; sets @p bodyStart past the blank line. */
std::optional<size_t> FindHeaderBoundary(std::string_view payload, size_t& bodyStart) {
    auto crlf = payload.find("\r\n\r\n");
    if (crlf != std::string_view::npos) {
        bodyStart = crlf + 4;
        return crlf;
    }
    auto lf = payload.find("\n\n");
    if (lf != std::string_view::npos) {
        bodyStart = lf + 2;
        return lf;
    }
    return std::nullopt;
}

} // namespace

RecordReader::RecordReader(std::string data) : m_data(std::move(data)) {}

bool RecordReader::readLine(std::string& line) {
    if (m_pos >= m_data.size()) {
        return false;
    }
    size_t end = m_data.find('\n', m_pos);
    if (end == std::string::npos) {
        line = m_data.substr(m_pos);
        m_pos = m_data.size();
    } else {
        line = m_data.substr(m_pos, end - m_pos);
        m_pos = end + 1;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

std::optional<domain::ArchiveRecord> RecordReader::next() {
    std::string line;
    while (!m_done) {
        // Scan forward to a version line
        bool found = false;
        while (readLine(line)) {
            if (line.rfind("WARC/", 0) == 0) {
                found = true;
                break;
            }
        }
        if (!found) {
            m_done = true;
            break;
        }

        std::map<std::string, std::string> headers; // lowercase name -> value
        bool headersComplete = false;
        while (readLine(line)) {
            if (line.empty()) {
                headersComplete = true;
                break;
            }
            auto colon = line.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            headers[ToLower(line.substr(0, colon))] = Trim(std::string_view(line).substr(colon + 1));
        }
        if (!headersComplete) {
            std::cerr << "[RecordParser] Truncated record header at end of segment" << std::endl;
            m_done = true;
            break;
        }

        uint64_t contentLength = 0;
        try {
            auto it = headers.find("content-length");
            if (it == headers.end()) {
                throw std::invalid_argument("missing Content-Length");
            }
            contentLength = std::stoull(it->second);
        } catch (const std::exception& e) {
            std::cerr << "[RecordParser] Skipping record with bad Content-Length: " << e.what() << std::endl;
            ++m_skipped;
            continue;
        }

        const size_t payloadStart = m_pos;
        if (contentLength > m_data.size() - payloadStart) {
            std::cerr << "[RecordParser] Content-Length " << contentLength
                      << " runs past the end of the segment, skipping record" << std::endl;
            ++m_skipped;
            continue;
        }

        // The block must be followed by the record separator and then another record or the end
        size_t after = payloadStart + static_cast<size_t>(contentLength);
        while (after < m_data.size() && (m_data[after] == '\r' || m_data[after] == '\n')) {
            ++after;
        }
        if (after < m_data.size() && m_data.compare(after, 5, "WARC/") != 0) {
            std::cerr << "[RecordParser] Content-Length " << contentLength
                      << " does not end at a record boundary, skipping record" << std::endl;
            ++m_skipped;
            continue;
        }

        domain::ArchiveRecord record;
        auto header = [&headers](const char* name) {
            auto it = headers.find(name);
            return it == headers.end() ? std::string() : it->second;
        };
        record.recordId = header("warc-record-id");
        record.recordType = header("warc-type");
        record.targetUri = header("warc-target-uri");
        record.date = header("warc-date");
        record.contentType = header("content-type");
        record.contentLength = contentLength;

        if (contentLength > 0) {
            record.payload = m_data.substr(payloadStart, static_cast<size_t>(contentLength));
        }

        if (record.recordType == "response" && record.payload) {
            size_t bodyStart = 0;
            if (auto boundary = FindHeaderBoundary(*record.payload, bodyStart)) {
                record.httpHeaders = RecordParser::ParseHeaderBlock(std::string_view(*record.payload).substr(0, *boundary));
            }
        }

        m_pos = after;
        return record;
    }
    return std::nullopt;
}

domain::HeaderMap RecordParser::ParseHeaderBlock(std::string_view headerSection) {
    domain::HeaderMap headers;
    std::string block(headerSection);
    std::stringstream ss(block);
    std::string line;
    bool statusLine = true;
    while (std::getline(ss, line)) {
        if (statusLine) {
            statusLine = false;
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string name = Trim(std::string_view(line).substr(0, colon));
        if (name.empty()) {
            continue;
        }
        headers[name] = Trim(std::string_view(line).substr(colon + 1));
    }
    return headers;
}

RecordReader RecordParser::parse(std::string_view segmentBytes) const {
    if (GzipCodec::IsGzipped(segmentBytes)) {
        if (auto inflated = GzipCodec::Decompress(segmentBytes)) {
            return RecordReader(std::move(*inflated));
        }
        std::cerr << "[RecordParser] Failed to decompress segment, parsing raw bytes" << std::endl;
    }
    return RecordReader(std::string(segmentBytes));
}

std::optional<domain::ArchiveRecord> RecordParser::locate(std::string_view segmentBytes, const std::string& targetUri) const {
    RecordReader reader = parse(segmentBytes);
    while (auto record = reader.next()) {
        if (record->targetUri == targetUri) {
            return record;
        }
    }
    return std::nullopt;
}

std::optional<domain::HttpResponse> RecordParser::toHttpResponse(const domain::ArchiveRecord& record) const {
    if (record.recordType != "response" || !record.payload || record.payload->empty()) {
        return std::nullopt;
    }

    const std::string& payload = *record.payload;
    domain::HttpResponse response;

    size_t bodyStart = 0;
    auto boundary = FindHeaderBoundary(payload, bodyStart);
    if (!boundary) {
        std::cerr << "[RecordParser] No header/body boundary in " << record.targetUri << ", assuming 200" << std::endl;
        response.statusCode = 200;
        response.statusInferred = true;
        response.headers = record.httpHeaders.value_or(domain::HeaderMap{});
        response.body = payload;
        return response;
    }

    std::string_view headerSection = std::string_view(payload).substr(0, *boundary);
    response.body = payload.substr(bodyStart);
    response.headers = record.httpHeaders ? *record.httpHeaders : ParseHeaderBlock(headerSection);

    std::string statusLine(headerSection.substr(0, headerSection.find('\n')));
    std::istringstream parts(statusLine);
    std::string protocol, code;
    parts >> protocol >> code;
    try {
        size_t consumed = 0;
        int status = std::stoi(code, &consumed);
        if (consumed != code.size() || status < 100 || status > 999) {
            throw std::invalid_argument("status out of range");
        }
        response.statusCode = status;
    } catch (const std::exception&) {
        response.statusCode = 200;
        response.statusInferred = true;
    }
    return response;
}

std::map<std::string, int> RecordParser::countByType(std::string_view segmentBytes) const {
    std::map<std::string, int> counts;
    RecordReader reader = parse(segmentBytes);
    while (auto record = reader.next()) {
        ++counts[record->recordType];
    }
    return counts;
}

} // namespace crawlscope::infrastructure
