/**
 * @file Reports.hpp
 * @brief Domain-level reports produced by the aggregation engine.
 *
 * Each report kind is its own statically typed struct; the cache stores them
 * as tagged envelopes (see infrastructure/ReportSerialization.hpp).
 */

#pragma once
#include <string>
#include <vector>
#include <map>
#include <utility>
#include <cstdint>

namespace crawlscope::domain {

/**
 * @struct TechnologyReport
 * @brief Technology usage aggregated over a sample of a domain's pages.
 */
struct TechnologyReport {
    std::string domain;
    std::string snapshotId;
    int pagesAnalyzed = 0;
    int pagesAttempted = 0;
    std::map<std::string, int> technologyCounts; ///< technology -> pages using it
    std::map<std::string, std::map<std::string, int>> categoryBreakdown; ///< category -> technology -> pages
    std::map<std::string, double> adoptionPercentage; ///< technology -> % of analyzed pages
};

/**
 * @struct LinkGraph
 * @brief Internal link structure of a sampled domain.
 *
 * Edges may reference targets outside @c nodes; those are kept for the caller
 * but take no part in ranking.
 */
struct LinkGraph {
    std::string domain;
    std::string snapshotId;
    int pagesAnalyzed = 0;
    int pagesAttempted = 0;
    std::vector<std::string> nodes; ///< Unique, in discovery order.
    std::vector<std::pair<std::string, std::string>> edges; ///< (source, target)
    std::vector<std::pair<std::string, int>> hubPages; ///< (url, inbound count), descending
    std::map<std::string, double> pagerank; ///< Sums to 1.0 over nodes.
};

/**
 * @struct KeywordStats
 * @brief Keyword occurrence counts and TF-IDF weights over a domain sample.
 */
struct KeywordStats {
    std::string domain;
    std::string snapshotId;
    int pagesAnalyzed = 0;
    int pagesAttempted = 0;
    std::vector<std::string> keywords;
    std::map<std::string, std::map<std::string, int>> frequencies; ///< keyword -> url -> count
    std::map<std::string, int> totalOccurrences; ///< keyword -> total count
    std::map<std::string, std::map<std::string, double>> tfidfScores; ///< keyword -> url -> score; absent when no page matched
};

/**
 * @struct DomainTimeline
 * @brief Evolution of a domain across snapshots given in chronological order.
 */
struct DomainTimeline {
    std::string domain;
    std::vector<std::string> snapshots; ///< Caller order, never re-sorted.
    std::map<std::string, int> pageCounts;
    std::map<std::string, uint64_t> sizeBytes;
    std::map<std::string, std::vector<std::string>> technologiesAdded; ///< keyed by the later snapshot of each pair
    std::map<std::string, std::vector<std::string>> technologiesRemoved;
};

/**
 * @struct HeaderReport
 * @brief Security, caching and server header survey of a domain sample.
 */
struct HeaderReport {
    std::string domain;
    std::string snapshotId;
    int pagesAnalyzed = 0;
    int pagesAttempted = 0;
    std::map<std::string, double> securityHeaderAdoption; ///< lowercase header -> % of analyzed pages
    std::map<std::string, int> cachingPolicyCounts; ///< no-cache / max-age / other
    std::map<std::string, int> serverCounts; ///< lowercase server product -> pages
    double securityScore = 0.0; ///< 0-100
    std::vector<std::string> recommendations;
};

} // namespace crawlscope::domain
