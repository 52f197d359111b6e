/**
 * @file IndexRecord.hpp
 * @brief Location entry returned by the index server for one capture.
 */

#pragma once
#include <string>
#include <cstdint>

namespace crawlscope::domain {

/**
 * @struct IndexRecord
 * @brief Points at one captured page inside a segment file.
 *
 * (segmentFilename, offset, length) is the only address into the object store.
 * The same URL may appear several times with different capture timestamps.
 */
struct IndexRecord {
    std::string url;
    std::string mimeType;
    int statusCode = 0;
    std::string contentDigest;
    std::string captureTimestamp; ///< Sortable yyyyMMddhhmmss string.
    uint64_t length = 0;
    uint64_t offset = 0;
    std::string segmentFilename;
};

/**
 * @enum MatchType
 * @brief How the index server interprets the query URL.
 */
enum class MatchType {
    Exact,
    Prefix,
    Domain,
    Range
};

inline std::string MatchTypeToString(MatchType type) {
    switch (type) {
        case MatchType::Exact: return "exact";
        case MatchType::Prefix: return "prefix";
        case MatchType::Domain: return "domain";
        case MatchType::Range: return "range";
    }
    return "exact";
}

} // namespace crawlscope::domain
