#include "application/AggregationEngine.hpp"
#include "application/BoundedFanOut.hpp"
#include "application/GraphMetrics.hpp"
#include "application/TextMetrics.hpp"
#include "infrastructure/ReportSerialization.hpp"
#include <set>
#include <unordered_set>
#include <algorithm>
#include <stdexcept>
#include <iostream>
#include <cctype>
#include <iterator>

namespace crawlscope::application {

namespace {

constexpr const char* kTechnologyKind = "technology_report";
constexpr const char* kLinkGraphKind = "link_graph";
constexpr const char* kKeywordKind = "keyword_stats";
constexpr const char* kTimelineKind = "domain_timeline";
constexpr const char* kHeaderKind = "header_report";

const std::vector<std::string> kSecurityHeaders = {
    "strict-transport-security",
    "content-security-policy",
    "x-frame-options",
    "x-content-type-options",
    "referrer-policy",
    "permissions-policy",
    "x-xss-protection"
};

// The first four security headers carry the score
constexpr size_t kEssentialHeaderCount = 4;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string Trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}

// Joins list inputs of cache keys; the unit separator does not occur in URLs or keywords
constexpr char kKeyPartSeparator = '\x1f';

} // namespace

AggregationEngine::AggregationEngine(std::shared_ptr<domain::ArchiveIndex> index,
                                     std::shared_ptr<domain::PageSource> pages,
                                     std::shared_ptr<domain::PageAnalyzer> analyzer,
                                     std::shared_ptr<infrastructure::CacheManager> cache,
                                     infrastructure::AggregationConfig config)
    : m_index(std::move(index)),
      m_pages(std::move(pages)),
      m_analyzer(std::move(analyzer)),
      m_cache(std::move(cache)),
      m_config(config) {
    if (!m_index || !m_pages) {
        throw std::invalid_argument("AggregationEngine needs an index and a page source");
    }
}

std::string AggregationEngine::resolveSnapshot(const std::string& snapshotId) const {
    if (!snapshotId.empty()) {
        return snapshotId;
    }
    auto latest = m_index->latestSnapshot();
    if (!latest) {
        std::cerr << "[AggregationEngine] No latest snapshot listed, keeping an empty snapshot id" << std::endl;
        return snapshotId;
    }
    return *latest;
}

domain::PageAnalyzer& AggregationEngine::requireAnalyzer(const char* operation) const {
    if (!m_analyzer) {
        throw std::invalid_argument(std::string(operation) + " requires a page analyzer");
    }
    return *m_analyzer;
}

template <typename T>
std::optional<T> AggregationEngine::loadCached(const std::string& kind, const std::string& key) const {
    if (!m_cache) {
        return std::nullopt;
    }
    auto blob = m_cache->get(key);
    if (!blob) {
        return std::nullopt;
    }
    return infrastructure::DecodeEnvelope<T>(kind, *blob);
}

template <typename T>
void AggregationEngine::storeCached(const std::string& kind, const std::string& key, const T& value) const {
    if (m_cache) {
        m_cache->set(key, infrastructure::EncodeEnvelope(kind, value), m_config.reportTtlSeconds);
    }
}

std::vector<std::string> AggregationEngine::sampleCandidates(const std::string& domainName,
                                                             const std::string& snapshotId,
                                                             int sampleSize,
                                                             std::vector<domain::IndexRecord>* records) {
    std::vector<std::string> candidates;
    if (sampleSize <= 0) {
        return candidates;
    }

    auto hits = m_index->search(domainName, snapshotId, sampleSize, domain::MatchType::Domain);
    std::unordered_set<std::string> seen;
    for (const auto& hit : hits) {
        if (static_cast<int>(candidates.size()) >= sampleSize) break;
        if (seen.insert(hit.url).second) {
            candidates.push_back(hit.url);
        }
    }
    if (records) {
        *records = std::move(hits);
    }
    return candidates;
}

domain::TechnologyReport AggregationEngine::technologyReport(const std::string& domainName,
                                                             const std::string& requestedSnapshot,
                                                             int sampleSize) {
    domain::PageAnalyzer& analyzer = requireAnalyzer("technologyReport");
    const std::string snapshotId = resolveSnapshot(requestedSnapshot);
    const std::string key = "tech_report:" + snapshotId + ":" + domainName + ":" + std::to_string(sampleSize);
    if (auto cached = loadCached<domain::TechnologyReport>(kTechnologyKind, key)) {
        std::cerr << "[AggregationEngine] Returning cached technology report for " << domainName << std::endl;
        return *cached;
    }

    domain::TechnologyReport report;
    report.domain = domainName;
    report.snapshotId = snapshotId;

    auto candidates = sampleCandidates(domainName, snapshotId, sampleSize);
    report.pagesAttempted = static_cast<int>(candidates.size());
    if (candidates.empty()) {
        std::cerr << "[AggregationEngine] No pages found for domain: " << domainName << std::endl;
        return report;
    }

    auto outcome = RunBoundedFanOut<std::vector<domain::DetectedTechnology>>(candidates, m_config.fanOutWidth,
        [&](const std::string& url) -> std::optional<std::vector<domain::DetectedTechnology>> {
            auto page = m_pages->fetchPage(url, snapshotId);
            if (!page) return std::nullopt;
            return analyzer.detectTechnologies(*page);
        },
        "AggregationEngine");

    for (const auto& url : candidates) {
        auto it = outcome.results.find(url);
        if (it == outcome.results.end()) continue;
        ++report.pagesAnalyzed;

        std::set<std::string> countedOnPage;
        for (const auto& technology : it->second) {
            if (!countedOnPage.insert(technology.name).second) continue;
            ++report.technologyCounts[technology.name];
            ++report.categoryBreakdown[technology.category][technology.name];
        }
    }

    for (const auto& [name, count] : report.technologyCounts) {
        report.adoptionPercentage[name] = TextMetrics::Round(100.0 * count / report.pagesAnalyzed, 2);
    }

    std::cerr << "[AggregationEngine] Analyzed " << report.pagesAnalyzed << "/" << report.pagesAttempted
              << " pages for " << domainName << std::endl;
    if (report.pagesAnalyzed > 0) {
        storeCached(kTechnologyKind, key, report);
    }
    return report;
}

domain::LinkGraph AggregationEngine::linkGraph(const std::string& domainName,
                                               const std::string& requestedSnapshot,
                                               int sampleSize,
                                               int depth) {
    domain::PageAnalyzer& analyzer = requireAnalyzer("linkGraph");
    const std::string snapshotId = resolveSnapshot(requestedSnapshot);
    depth = std::max(1, depth);
    const std::string key = "link_graph:" + snapshotId + ":" + domainName + ":" +
                            std::to_string(sampleSize) + ":" + std::to_string(depth);
    if (auto cached = loadCached<domain::LinkGraph>(kLinkGraphKind, key)) {
        std::cerr << "[AggregationEngine] Returning cached link graph for " << domainName << std::endl;
        return *cached;
    }

    domain::LinkGraph graph;
    graph.domain = domainName;
    graph.snapshotId = snapshotId;

    std::vector<std::string> wave = sampleCandidates(domainName, snapshotId, sampleSize);
    if (wave.empty()) {
        std::cerr << "[AggregationEngine] No pages found for domain: " << domainName << std::endl;
        return graph;
    }

    std::unordered_set<std::string> inGraph(wave.begin(), wave.end());
    graph.nodes = wave;

    for (int level = 1; level <= depth && !wave.empty(); ++level) {
        auto outcome = RunBoundedFanOut<std::vector<std::string>>(wave, m_config.fanOutWidth,
            [&](const std::string& url) -> std::optional<std::vector<std::string>> {
                auto page = m_pages->fetchPage(url, snapshotId);
                if (!page) return std::nullopt;
                return analyzer.extractInternalLinks(*page);
            },
            "AggregationEngine");

        graph.pagesAttempted += static_cast<int>(wave.size());
        graph.pagesAnalyzed += static_cast<int>(outcome.results.size());

        std::vector<std::string> discovered;
        for (const auto& source : wave) {
            auto it = outcome.results.find(source);
            if (it == outcome.results.end()) continue;
            for (const auto& target : it->second) {
                if (target.empty()) continue;
                graph.edges.emplace_back(source, target);
                if (inGraph.count(target) == 0 &&
                    std::find(discovered.begin(), discovered.end(), target) == discovered.end()) {
                    discovered.push_back(target);
                }
            }
        }

        // The next level only expands while the sample budget allows
        wave.clear();
        if (level < depth) {
            for (const auto& target : discovered) {
                if (static_cast<int>(graph.nodes.size()) >= sampleSize) break;
                inGraph.insert(target);
                graph.nodes.push_back(target);
                wave.push_back(target);
            }
        }
    }

    graph.hubPages = GraphMetrics::HubPages(graph.edges);
    graph.pagerank = GraphMetrics::PageRank(graph.nodes, graph.edges);

    std::cerr << "[AggregationEngine] Graph for " << domainName << ": " << graph.nodes.size() << " nodes, "
              << graph.edges.size() << " edges" << std::endl;
    if (graph.pagesAnalyzed > 0) {
        storeCached(kLinkGraphKind, key, graph);
    }
    return graph;
}

domain::KeywordStats AggregationEngine::keywordFrequency(const std::string& domainName,
                                                         const std::vector<std::string>& keywords,
                                                         const std::string& requestedSnapshot,
                                                         int sampleSize,
                                                         bool caseSensitive) {
    domain::PageAnalyzer& analyzer = requireAnalyzer("keywordFrequency");
    const std::string snapshotId = resolveSnapshot(requestedSnapshot);

    std::vector<std::string> sortedKeywords = keywords;
    std::sort(sortedKeywords.begin(), sortedKeywords.end());
    const std::string key = "keyword_freq:" + snapshotId + ":" + domainName + ":" + Join(sortedKeywords, std::string(1, kKeyPartSeparator)) +
                            ":" + std::to_string(sampleSize) + ":" + (caseSensitive ? "1" : "0");
    if (auto cached = loadCached<domain::KeywordStats>(kKeywordKind, key)) {
        std::cerr << "[AggregationEngine] Returning cached keyword analysis for " << domainName << std::endl;
        return *cached;
    }

    domain::KeywordStats stats;
    stats.domain = domainName;
    stats.snapshotId = snapshotId;
    stats.keywords = keywords;
    for (const auto& keyword : keywords) {
        stats.frequencies[keyword];
        stats.totalOccurrences[keyword] = 0;
    }

    auto candidates = sampleCandidates(domainName, snapshotId, sampleSize);
    stats.pagesAttempted = static_cast<int>(candidates.size());
    if (candidates.empty()) {
        std::cerr << "[AggregationEngine] No pages found for domain: " << domainName << std::endl;
        return stats;
    }

    auto outcome = RunBoundedFanOut<std::string>(candidates, m_config.fanOutWidth,
        [&](const std::string& url) -> std::optional<std::string> {
            auto page = m_pages->fetchPage(url, snapshotId);
            if (!page) return std::nullopt;
            return analyzer.extractText(*page);
        },
        "AggregationEngine");

    for (const auto& url : candidates) {
        auto it = outcome.results.find(url);
        if (it == outcome.results.end()) continue;
        ++stats.pagesAnalyzed;

        for (const auto& keyword : keywords) {
            int count = TextMetrics::CountOccurrences(it->second, keyword, caseSensitive);
            if (count > 0) {
                stats.frequencies[keyword][url] = count;
                stats.totalOccurrences[keyword] += count;
            }
        }
    }

    stats.tfidfScores = TextMetrics::TfIdf(stats.frequencies, static_cast<int>(candidates.size()));

    std::cerr << "[AggregationEngine] Keyword analysis over " << stats.pagesAnalyzed << "/" << stats.pagesAttempted
              << " pages for " << domainName << std::endl;
    if (stats.pagesAnalyzed > 0) {
        storeCached(kKeywordKind, key, stats);
    }
    return stats;
}

domain::DomainTimeline AggregationEngine::evolutionTimeline(const std::string& domainName,
                                                            const std::vector<std::string>& requestedSnapshots,
                                                            int sampleSize) {
    domain::PageAnalyzer& analyzer = requireAnalyzer("evolutionTimeline");
    std::vector<std::string> snapshotIds;
    for (const auto& snapshot : requestedSnapshots) {
        snapshotIds.push_back(resolveSnapshot(snapshot));
    }
    const std::string key = "timeline:" + domainName + ":" + Join(snapshotIds, std::string(1, kKeyPartSeparator)) + ":" + std::to_string(sampleSize);
    if (auto cached = loadCached<domain::DomainTimeline>(kTimelineKind, key)) {
        std::cerr << "[AggregationEngine] Returning cached timeline for " << domainName << std::endl;
        return *cached;
    }

    domain::DomainTimeline timeline;
    timeline.domain = domainName;
    timeline.snapshots = snapshotIds;

    std::map<std::string, std::set<std::string>> technologiesBySnapshot;
    bool anyPages = false;

    for (size_t i = 0; i < snapshotIds.size(); ++i) {
        const std::string& snapshot = snapshotIds[i];
        std::cerr << "[AggregationEngine] Timeline snapshot " << (i + 1) << "/" << snapshotIds.size()
                  << ": " << snapshot << std::endl;

        std::vector<domain::IndexRecord> records;
        auto urls = sampleCandidates(domainName, snapshot, sampleSize, &records);
        timeline.pageCounts[snapshot] = static_cast<int>(urls.size());

        uint64_t totalSize = 0;
        const size_t sized = std::min(records.size(), static_cast<size_t>(std::max(0, sampleSize)));
        for (size_t r = 0; r < sized; ++r) {
            totalSize += records[r].length;
        }
        timeline.sizeBytes[snapshot] = totalSize;

        std::set<std::string>& technologies = technologiesBySnapshot[snapshot];
        if (urls.empty()) {
            std::cerr << "[AggregationEngine] No pages for " << domainName << " in " << snapshot << std::endl;
            continue;
        }
        anyPages = true;

        if (urls.size() > static_cast<size_t>(kTimelineSampleUrls)) {
            urls.resize(kTimelineSampleUrls);
        }
        auto outcome = RunBoundedFanOut<std::vector<domain::DetectedTechnology>>(urls, m_config.timelineFanOutWidth,
            [&](const std::string& url) -> std::optional<std::vector<domain::DetectedTechnology>> {
                auto page = m_pages->fetchPage(url, snapshot);
                if (!page) return std::nullopt;
                return analyzer.detectTechnologies(*page);
            },
            "AggregationEngine");

        for (const auto& url : urls) {
            auto it = outcome.results.find(url);
            if (it == outcome.results.end()) continue;
            for (const auto& technology : it->second) {
                technologies.insert(technology.name);
            }
        }
    }

    for (size_t i = 1; i < snapshotIds.size(); ++i) {
        const auto& previous = technologiesBySnapshot[snapshotIds[i - 1]];
        const auto& current = technologiesBySnapshot[snapshotIds[i]];

        std::vector<std::string> added;
        std::set_difference(current.begin(), current.end(), previous.begin(), previous.end(), std::back_inserter(added));
        std::vector<std::string> removed;
        std::set_difference(previous.begin(), previous.end(), current.begin(), current.end(), std::back_inserter(removed));

        timeline.technologiesAdded[snapshotIds[i]] = std::move(added);
        timeline.technologiesRemoved[snapshotIds[i]] = std::move(removed);
    }

    if (anyPages) {
        storeCached(kTimelineKind, key, timeline);
    }
    return timeline;
}

domain::HeaderReport AggregationEngine::headerAnalysis(const std::string& domainName,
                                                       const std::string& requestedSnapshot,
                                                       int sampleSize) {
    const std::string snapshotId = resolveSnapshot(requestedSnapshot);
    const std::string key = "header_analysis:" + snapshotId + ":" + domainName + ":" + std::to_string(sampleSize);
    if (auto cached = loadCached<domain::HeaderReport>(kHeaderKind, key)) {
        std::cerr << "[AggregationEngine] Returning cached header analysis for " << domainName << std::endl;
        return *cached;
    }

    domain::HeaderReport report;
    report.domain = domainName;
    report.snapshotId = snapshotId;

    auto candidates = sampleCandidates(domainName, snapshotId, sampleSize);
    report.pagesAttempted = static_cast<int>(candidates.size());
    if (candidates.empty()) {
        std::cerr << "[AggregationEngine] No pages found for domain: " << domainName << std::endl;
        report.recommendations.push_back("No data available for analysis");
        return report;
    }

    auto outcome = RunBoundedFanOut<domain::HeaderMap>(candidates, m_config.fanOutWidth,
        [&](const std::string& url) -> std::optional<domain::HeaderMap> {
            auto page = m_pages->fetchPage(url, snapshotId);
            if (!page) return std::nullopt;
            return page->headers;
        },
        "AggregationEngine");

    std::map<std::string, int> securityCounts;
    for (const auto& url : candidates) {
        auto it = outcome.results.find(url);
        if (it == outcome.results.end()) continue;
        ++report.pagesAnalyzed;

        std::map<std::string, std::string> headers;
        for (const auto& [name, value] : it->second) {
            headers[ToLower(name)] = value;
        }

        for (const auto& header : kSecurityHeaders) {
            if (headers.count(header)) ++securityCounts[header];
        }

        auto cacheControl = headers.find("cache-control");
        if (cacheControl != headers.end()) {
            const std::string policy = ToLower(cacheControl->second);
            if (policy.find("no-cache") != std::string::npos || policy.find("no-store") != std::string::npos) {
                ++report.cachingPolicyCounts["no-cache"];
            } else if (policy.find("max-age") != std::string::npos) {
                ++report.cachingPolicyCounts["max-age"];
            } else {
                ++report.cachingPolicyCounts["other"];
            }
        }

        auto server = headers.find("server");
        if (server != headers.end()) {
            std::string name = ToLower(Trim(server->second.substr(0, server->second.find('/'))));
            ++report.serverCounts[name];
        }
    }

    for (const auto& header : kSecurityHeaders) {
        double adoption = report.pagesAnalyzed > 0
            ? 100.0 * securityCounts[header] / report.pagesAnalyzed
            : 0.0;
        report.securityHeaderAdoption[header] = TextMetrics::Round(adoption, 2);
    }

    const double pointsPerHeader = 100.0 / kEssentialHeaderCount;
    double score = 0.0;
    for (size_t i = 0; i < kEssentialHeaderCount; ++i) {
        score += report.securityHeaderAdoption[kSecurityHeaders[i]] / 100.0 * pointsPerHeader;
    }
    report.securityScore = TextMetrics::Round(score, 2);

    const auto& adoption = report.securityHeaderAdoption;
    if (adoption.at("strict-transport-security") < 80.0) {
        report.recommendations.push_back("Enable HSTS (Strict-Transport-Security) to enforce HTTPS connections");
    }
    if (adoption.at("content-security-policy") < 50.0) {
        report.recommendations.push_back("Implement Content-Security-Policy to prevent XSS and data injection attacks");
    }
    if (adoption.at("x-frame-options") < 80.0) {
        report.recommendations.push_back("Add X-Frame-Options header to prevent clickjacking attacks");
    }
    if (adoption.at("x-content-type-options") < 80.0) {
        report.recommendations.push_back("Set X-Content-Type-Options: nosniff to prevent MIME sniffing");
    }

    if (report.securityScore >= 90.0) {
        report.recommendations.push_back("Excellent security header coverage");
    } else if (report.securityScore >= 70.0) {
        report.recommendations.push_back("Good security header coverage with room for improvement");
    } else if (report.securityScore >= 50.0) {
        report.recommendations.push_back("Moderate security header coverage, consider improvements");
    } else {
        report.recommendations.push_back("Poor security header coverage, immediate action recommended");
    }

    std::cerr << "[AggregationEngine] Header analysis over " << report.pagesAnalyzed << "/" << report.pagesAttempted
              << " pages for " << domainName << std::endl;
    if (report.pagesAnalyzed > 0) {
        storeCached(kHeaderKind, key, report);
    }
    return report;
}

} // namespace crawlscope::application
