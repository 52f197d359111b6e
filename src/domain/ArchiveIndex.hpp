/**
 * @file ArchiveIndex.hpp
 * @brief Interface to the remote capture index.
 */

#pragma once
#include <string>
#include <vector>
#include <optional>
#include "CrawlSnapshot.hpp"
#include "IndexRecord.hpp"

namespace crawlscope::domain {

/**
 * @class ArchiveIndex
 * @brief Abstract lookup of captures by URL, implemented against a CDX server.
 */
class ArchiveIndex {
public:
    virtual ~ArchiveIndex() = default;

    /** @brief Lists all snapshots known to the index; empty when unavailable. */
    virtual std::vector<CrawlSnapshot> listSnapshots() = 0;

    /**
     * @brief Finds captures matching a query.
     * @param query URL or domain.
     * @param snapshotId Snapshot to search, or nullopt for the latest one.
     * @param limit Maximum number of records.
     * @param matchType Interpretation of @p query.
     * @return Matching records; empty when nothing matched or the index failed.
     */
    virtual std::vector<IndexRecord> search(const std::string& query,
                                            const std::optional<std::string>& snapshotId,
                                            int limit,
                                            MatchType matchType) = 0;

    /** @brief Id of the most recent snapshot, or nullopt if none is listed. */
    virtual std::optional<std::string> latestSnapshot() = 0;
};

} // namespace crawlscope::domain
