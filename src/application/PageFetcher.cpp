#include "application/PageFetcher.hpp"
#include "application/BoundedFanOut.hpp"
#include "infrastructure/ReportSerialization.hpp"
#include <iostream>
#include <set>

namespace crawlscope::application {

namespace {
constexpr const char* kPageKind = "page";
}

PageFetcher::PageFetcher(std::shared_ptr<domain::ArchiveIndex> index,
                         std::shared_ptr<infrastructure::ArchiveObjectClient> objects,
                         std::shared_ptr<infrastructure::CacheManager> cache,
                         std::string defaultSnapshot)
    : m_index(std::move(index)),
      m_objects(std::move(objects)),
      m_cache(std::move(cache)),
      m_defaultSnapshot(std::move(defaultSnapshot)) {}

std::string PageFetcher::resolveSnapshot(const std::string& snapshotId) {
    if (!snapshotId.empty()) {
        return snapshotId;
    }
    return m_index->latestSnapshot().value_or(m_defaultSnapshot);
}

std::optional<domain::PageContent> PageFetcher::fetchPage(const std::string& url, const std::string& snapshotId) {
    const std::string snapshot = resolveSnapshot(snapshotId);
    const std::string cacheKey = "page:" + url + ":" + snapshot;

    if (m_cache) {
        if (auto blob = m_cache->get(cacheKey)) {
            if (auto cached = infrastructure::DecodeEnvelope<domain::PageContent>(kPageKind, *blob)) {
                return cached;
            }
        }
    }

    auto page = fetchUncached(url, snapshot);
    if (page && m_cache) {
        m_cache->set(cacheKey, infrastructure::EncodeEnvelope(kPageKind, *page), kPageTtlSeconds);
    }
    return page;
}

std::optional<domain::PageContent> PageFetcher::fetchUncached(const std::string& url, const std::string& snapshot) {
    auto hits = m_index->search(url, snapshot, 1, domain::MatchType::Exact);
    if (hits.empty()) {
        std::cerr << "[PageFetcher] Not in index: " << url << " (" << snapshot << ")" << std::endl;
        return std::nullopt;
    }
    const domain::IndexRecord& entry = hits.front();
    if (entry.length == 0) {
        std::cerr << "[PageFetcher] Index entry for " << url << " has zero length" << std::endl;
        return std::nullopt;
    }

    auto segment = m_objects->downloadRange(entry.segmentFilename, entry.offset, entry.offset + entry.length - 1);
    if (!segment) {
        return std::nullopt;
    }

    auto record = m_parser.locate(*segment, url);
    if (!record) {
        // The range holds exactly one capture; its target URI may be normalized differently
        auto reader = m_parser.parse(*segment);
        while (auto candidate = reader.next()) {
            if (candidate->recordType == "response") {
                record = std::move(candidate);
                break;
            }
        }
    }
    if (!record) {
        std::cerr << "[PageFetcher] No archive record for " << url << " in " << entry.segmentFilename << std::endl;
        return std::nullopt;
    }

    auto response = m_parser.toHttpResponse(*record);
    if (!response) {
        std::cerr << "[PageFetcher] Could not extract HTTP response for " << url << std::endl;
        return std::nullopt;
    }

    domain::PageContent page;
    page.url = url;
    page.snapshotId = snapshot;
    page.statusCode = response->statusCode;
    page.statusInferred = response->statusInferred;
    page.headers = std::move(response->headers);
    page.body = std::move(response->body);
    page.mimeType = entry.mimeType;
    page.captureTimestamp = entry.captureTimestamp;
    page.length = entry.length;
    return page;
}

BatchFetchResult PageFetcher::fetchBatch(const std::vector<std::string>& urls, const std::string& snapshotId, int maxConcurrent) {
    BatchFetchResult batch;
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& url : urls) {
        if (seen.insert(url).second) {
            unique.push_back(url);
        }
    }
    batch.total = static_cast<int>(unique.size());
    if (unique.empty()) {
        return batch;
    }

    const std::string snapshot = resolveSnapshot(snapshotId);
    auto outcome = RunBoundedFanOut<domain::PageContent>(unique, maxConcurrent,
        [this, &snapshot](const std::string& url) { return fetchPage(url, snapshot); },
        "PageFetcher");

    for (const auto& url : unique) {
        auto it = outcome.results.find(url);
        if (it != outcome.results.end()) {
            batch.pages.emplace(url, it->second);
        } else {
            batch.failedUrls.push_back(url);
        }
    }
    batch.successful = static_cast<int>(batch.pages.size());
    batch.failed = batch.total - batch.successful;

    std::cerr << "[PageFetcher] Batch fetch: " << batch.successful << " successful, " << batch.failed << " failed" << std::endl;
    return batch;
}

} // namespace crawlscope::application
