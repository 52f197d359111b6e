/**
 * @file PageFetcher.hpp
 * @brief Materializes one archived page from index lookup to HTTP response.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include "domain/PageSource.hpp"
#include "domain/ArchiveIndex.hpp"
#include "infrastructure/ArchiveObjectClient.hpp"
#include "infrastructure/CacheManager.hpp"
#include "infrastructure/RecordParser.hpp"

namespace crawlscope::application {

/**
 * @struct BatchFetchResult
 * @brief Outcome of fetchBatch; @c pages holds only the successful URLs.
 */
struct BatchFetchResult {
    int total = 0;
    int successful = 0;
    int failed = 0;
    std::map<std::string, domain::PageContent> pages;
    std::vector<std::string> failedUrls;
};

/**
 * @class PageFetcher
 * @brief PageSource backed by the index, the object store and the cache.
 *
 * A page is found with an exact index lookup, its record is range-downloaded
 * from the segment file, then parsed into an HTTP response. Results are
 * cached for a day under "page:<url>:<snapshot>".
 */
class PageFetcher : public domain::PageSource {
public:
    static constexpr int kPageTtlSeconds = 24 * 3600;

    PageFetcher(std::shared_ptr<domain::ArchiveIndex> index,
                std::shared_ptr<infrastructure::ArchiveObjectClient> objects,
                std::shared_ptr<infrastructure::CacheManager> cache,
                std::string defaultSnapshot);

    /** @param snapshotId Empty selects the latest snapshot. */
    std::optional<domain::PageContent> fetchPage(const std::string& url, const std::string& snapshotId) override;

    /** @brief Fetches the distinct @p urls with at most @p maxConcurrent in flight. */
    BatchFetchResult fetchBatch(const std::vector<std::string>& urls, const std::string& snapshotId, int maxConcurrent = 5);

private:
    std::string resolveSnapshot(const std::string& snapshotId);
    std::optional<domain::PageContent> fetchUncached(const std::string& url, const std::string& snapshotId);

    std::shared_ptr<domain::ArchiveIndex> m_index;
    std::shared_ptr<infrastructure::ArchiveObjectClient> m_objects;
    std::shared_ptr<infrastructure::CacheManager> m_cache;
    infrastructure::RecordParser m_parser;
    std::string m_defaultSnapshot;
};

} // namespace crawlscope::application
