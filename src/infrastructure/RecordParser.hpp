/**
 * @file RecordParser.hpp
 * @brief WARC record framing and HTTP response reconstruction.
 */

#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <map>
#include "domain/ArchiveRecord.hpp"

namespace crawlscope::infrastructure {

/**
 * @class RecordReader
 * @brief Forward-only iteration over the records of one decompressed segment.
 *
 * A record whose Content-Length is missing, runs past the end of the input,
 * or does not end at the next "WARC/" line (or the end) is skipped; reading
 * resumes at the next "WARC/" version line after its header.
 */
class RecordReader {
public:
    explicit RecordReader(std::string data);

    /** @brief Next record, or nullopt at the end of the segment. */
    std::optional<domain::ArchiveRecord> next();

    /** @brief Records dropped as malformed so far. */
    int skippedRecords() const { return m_skipped; }

private:
    bool readLine(std::string& line);

    std::string m_data;
    size_t m_pos = 0;
    bool m_done = false;
    int m_skipped = 0;
};

/**
 * @class RecordParser
 * @brief Stateless entry points over segment bytes, gzip-wrapped or not.
 */
class RecordParser {
public:
    /** @brief Reader over @p segmentBytes; a gzip wrapper is undone first. */
    RecordReader parse(std::string_view segmentBytes) const;

    /** @brief First record whose target URI equals @p targetUri. */
    std::optional<domain::ArchiveRecord> locate(std::string_view segmentBytes, const std::string& targetUri) const;

    /**
     * @brief Splits a response record into status, headers and body.
     *
     * Returns nullopt for non-response records and empty payloads. Without a
     * header/body boundary, or without a readable status line, the status is
     * reported as 200 with statusInferred set.
     */
    std::optional<domain::HttpResponse> toHttpResponse(const domain::ArchiveRecord& record) const;

    /** @brief Number of records per WARC-Type. */
    std::map<std::string, int> countByType(std::string_view segmentBytes) const;

    /** @brief "Name: value" lines after the status line of an HTTP header block. */
    static domain::HeaderMap ParseHeaderBlock(std::string_view headerSection);
};

} // namespace crawlscope::infrastructure
