/**
 * @file ArchiveIndexClient.hpp
 * @brief CDX index server client.
 */

#pragma once
#include <string>
#include <vector>
#include <deque>
#include <optional>
#include <memory>
#include <utility>
#include <chrono>
#include "domain/ArchiveIndex.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/RequestThrottle.hpp"
#include "infrastructure/UrlUtils.hpp"

namespace crawlscope::infrastructure {

class ArchiveIndexClient;

/**
 * @class DomainRecordStream
 * @brief Pull-style paging over every capture of a domain.
 *
 * Each page is one request carrying an explicit page number. The stream ends
 * on the first empty page, on a failed request, or once the limit is reached.
 * Nothing is kept server side, so a new stream restarts from page 0.
 */
class DomainRecordStream {
public:
    /** @brief Next record, or nullopt when the stream is exhausted. */
    std::optional<domain::IndexRecord> next();

    /** @brief Drains the remaining records. */
    std::vector<domain::IndexRecord> collect();

    int pagesFetched() const { return m_page; }

private:
    friend class ArchiveIndexClient;
    DomainRecordStream(ArchiveIndexClient* client, std::string domain, std::string snapshotId,
                       std::optional<int> limit);

    bool fetchNextPage();

    ArchiveIndexClient* m_client;
    std::string m_domain;
    std::string m_snapshotId;
    std::optional<int> m_limit;
    std::deque<domain::IndexRecord> m_buffer;
    int m_page = 0;
    int m_yielded = 0;
    bool m_done = false;
};

/**
 * @class ArchiveIndexClient
 * @brief ArchiveIndex implementation against a CDX server over HTTP.
 *
 * Requests go through a RequestThrottle, which may be shared with the object
 * client. Remote failures and malformed lines are logged and yield empty
 * results; nothing here throws once constructed.
 */
class ArchiveIndexClient : public domain::ArchiveIndex {
public:
    static constexpr int kStreamPageSize = 1000;

    ArchiveIndexClient(const IndexConfig& config, std::shared_ptr<RequestThrottle> throttle);

    std::vector<domain::CrawlSnapshot> listSnapshots() override;

    std::vector<domain::IndexRecord> search(const std::string& query,
                                            const std::optional<std::string>& snapshotId,
                                            int limit,
                                            domain::MatchType matchType) override;

    std::optional<std::string> latestSnapshot() override;

    /**
     * @brief Lazily pages through every capture under @p domainName.
     * @param limit Maximum records to yield; nullopt for all.
     */
    DomainRecordStream streamDomain(const std::string& domainName,
                                    const std::string& snapshotId,
                                    std::optional<int> limit = std::nullopt);

    /** @brief @p snapshotId, else the latest snapshot, else the configured default. */
    std::string resolveSnapshot(const std::optional<std::string>& snapshotId);

    /**
     * @brief Parses one NDJSON line: a 9-field positional array
     *        [urlkey, timestamp, url, mime, status, digest, length, offset, filename]
     *        or the equivalent keyed object.
     * @return nullopt for malformed lines.
     */
    static std::optional<domain::IndexRecord> ParseRecordLine(const std::string& line);

    /**
     * @brief Approximate crawl date of ids like "CC-MAIN-2024-10"
     *        (January 1st of the year plus week-1 weeks); now if unparsable.
     */
    static std::chrono::system_clock::time_point DecodeSnapshotDate(const std::string& snapshotId);

private:
    friend class DomainRecordStream;
    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    /** @brief GET under the throttle; body on 200, nullopt otherwise. */
    std::optional<std::string> fetchText(const std::string& path, const QueryParams& params);

    /** @brief Parses an NDJSON body, skipping malformed lines. */
    static std::vector<domain::IndexRecord> ParseRecords(const std::string& body, int* nonEmptyLines = nullptr);

    IndexConfig m_config;
    ServiceUrl m_url;
    std::shared_ptr<RequestThrottle> m_throttle;
};

} // namespace crawlscope::infrastructure
