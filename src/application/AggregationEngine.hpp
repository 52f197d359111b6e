/**
 * @file AggregationEngine.hpp
 * @brief Domain-wide reports computed over a sample of archived pages.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "domain/ArchiveIndex.hpp"
#include "domain/PageSource.hpp"
#include "domain/PageAnalyzer.hpp"
#include "domain/Reports.hpp"
#include "infrastructure/CacheManager.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace crawlscope::application {

/**
 * @class AggregationEngine
 * @brief Samples a domain from the index, fans page work out over a bounded
 *        pool, and folds the successful results into one report.
 *
 * Every operation follows the same steps: list the domain's captures with a
 * domain match, drop duplicate URLs (first occurrence wins) and truncate to
 * the sample size, run per-page work, then fold by URL. Pages that fail are
 * logged and counted, never raised; reports carry pagesAnalyzed against
 * pagesAttempted.
 *
 * An empty snapshot id selects the latest snapshot before anything else
 * happens. Reports are cached under a key built from all inputs, with the
 * resolved snapshot. Reports with no analyzed page are not cached.
 */
class AggregationEngine {
public:
    /**
     * @param analyzer May be null; operations that need it then throw
     *        std::invalid_argument.
     * @param cache May be null to disable report caching.
     */
    AggregationEngine(std::shared_ptr<domain::ArchiveIndex> index,
                      std::shared_ptr<domain::PageSource> pages,
                      std::shared_ptr<domain::PageAnalyzer> analyzer,
                      std::shared_ptr<infrastructure::CacheManager> cache,
                      infrastructure::AggregationConfig config = {});

    domain::TechnologyReport technologyReport(const std::string& domainName,
                                              const std::string& snapshotId,
                                              int sampleSize = 100);

    /**
     * @param depth 1 links the sampled pages only; each further level fetches
     *        newly discovered targets while the node count stays within
     *        @p sampleSize.
     */
    domain::LinkGraph linkGraph(const std::string& domainName,
                                const std::string& snapshotId,
                                int sampleSize = 100,
                                int depth = 1);

    domain::KeywordStats keywordFrequency(const std::string& domainName,
                                          const std::vector<std::string>& keywords,
                                          const std::string& snapshotId,
                                          int sampleSize = 100,
                                          bool caseSensitive = false);

    /**
     * @param snapshotIds Chronological order as given; never re-sorted.
     */
    domain::DomainTimeline evolutionTimeline(const std::string& domainName,
                                             const std::vector<std::string>& snapshotIds,
                                             int sampleSize = 100);

    domain::HeaderReport headerAnalysis(const std::string& domainName,
                                        const std::string& snapshotId,
                                        int sampleSize = 100);

    static constexpr int kTimelineSampleUrls = 10;

private:
    /** @brief Unique candidate URLs in index order, at most @p sampleSize. */
    std::vector<std::string> sampleCandidates(const std::string& domainName,
                                              const std::string& snapshotId,
                                              int sampleSize,
                                              std::vector<domain::IndexRecord>* records = nullptr);

    /** @brief @p snapshotId, or the latest snapshot when it is empty. */
    std::string resolveSnapshot(const std::string& snapshotId) const;

    domain::PageAnalyzer& requireAnalyzer(const char* operation) const;

    template <typename T>
    std::optional<T> loadCached(const std::string& kind, const std::string& key) const;

    template <typename T>
    void storeCached(const std::string& kind, const std::string& key, const T& value) const;

    std::shared_ptr<domain::ArchiveIndex> m_index;
    std::shared_ptr<domain::PageSource> m_pages;
    std::shared_ptr<domain::PageAnalyzer> m_analyzer;
    std::shared_ptr<infrastructure::CacheManager> m_cache;
    infrastructure::AggregationConfig m_config;
};

} // namespace crawlscope::application
