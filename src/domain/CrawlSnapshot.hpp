/**
 * @file CrawlSnapshot.hpp
 * @brief One generation of the archive as listed by the index server.
 */

#pragma once
#include <string>
#include <chrono>

namespace crawlscope::domain {

/**
 * @enum SnapshotStatus
 * @brief Lifecycle state reported for a snapshot.
 */
enum class SnapshotStatus {
    Active,
    Complete,
    Processing,
    Unknown
};

inline std::string SnapshotStatusToString(SnapshotStatus status) {
    switch (status) {
        case SnapshotStatus::Active: return "active";
        case SnapshotStatus::Complete: return "complete";
        case SnapshotStatus::Processing: return "processing";
        case SnapshotStatus::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * @struct CrawlSnapshot
 * @brief Immutable description of a crawl generation (e.g. CC-MAIN-2024-10).
 */
struct CrawlSnapshot {
    std::string id; ///< Opaque sortable identifier.
    std::string name; ///< Display name from the collection listing.
    std::chrono::system_clock::time_point date; ///< Approximate date decoded from the id.
    SnapshotStatus status = SnapshotStatus::Unknown;
};

} // namespace crawlscope::domain
