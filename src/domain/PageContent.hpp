/**
 * @file PageContent.hpp
 * @brief An archived page materialized from the index and the object store.
 */

#pragma once
#include <string>
#include <cstdint>
#include "ArchiveRecord.hpp"

namespace crawlscope::domain {

struct PageContent {
    std::string url;
    std::string snapshotId;
    int statusCode = 0;
    bool statusInferred = false; ///< See HttpResponse::statusInferred.
    HeaderMap headers;
    std::string body;
    std::string mimeType;
    std::string captureTimestamp;
    uint64_t length = 0;
};

} // namespace crawlscope::domain
