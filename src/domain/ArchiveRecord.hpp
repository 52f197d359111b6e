/**
 * @file ArchiveRecord.hpp
 * @brief Parsed WARC records and the HTTP exchange reconstructed from them.
 */

#pragma once
#include <string>
#include <map>
#include <optional>
#include <cstdint>

namespace crawlscope::domain {

/// Header name -> value, original case preserved, last occurrence wins.
using HeaderMap = std::map<std::string, std::string>;

/**
 * @struct ArchiveRecord
 * @brief One framed unit of a segment file.
 *
 * Built transiently while iterating a segment; never persisted except as an
 * opaque cached value.
 */
struct ArchiveRecord {
    std::string recordId; ///< WARC-Record-ID.
    std::string recordType; ///< response, request, metadata, warcinfo, ...
    std::string targetUri; ///< WARC-Target-URI.
    std::string date; ///< WARC-Date, ISO-8601 as written in the record.
    std::string contentType;
    uint64_t contentLength = 0;
    std::optional<HeaderMap> httpHeaders; ///< Present for response records with an HTTP head.
    std::optional<std::string> payload; ///< Raw record block (full HTTP message for responses).
};

/**
 * @struct HttpResponse
 * @brief HTTP response reconstructed from a response record.
 */
struct HttpResponse {
    int statusCode = 200;
    HeaderMap headers;
    std::string body;
    /** @brief True when 200 was assumed because no status line or header boundary was found. */
    bool statusInferred = false;
};

} // namespace crawlscope::domain
