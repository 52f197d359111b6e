#include "infrastructure/ReportSerialization.hpp"
#include <ctime>

using json = nlohmann::json;

namespace crawlscope::domain {

namespace {

std::string FormatDate(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

template <typename T>
void ReadOptional(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        j[key].get_to(target);
    }
}

} // namespace

void to_json(json& j, const CrawlSnapshot& snapshot) {
    j = json{
        {"id", snapshot.id},
        {"name", snapshot.name},
        {"date", FormatDate(snapshot.date)},
        {"status", SnapshotStatusToString(snapshot.status)}
    };
}

void to_json(json& j, const IndexRecord& record) {
    j = json{
        {"url", record.url},
        {"mimeType", record.mimeType},
        {"statusCode", record.statusCode},
        {"digest", record.contentDigest},
        {"timestamp", record.captureTimestamp},
        {"length", record.length},
        {"offset", record.offset},
        {"filename", record.segmentFilename}
    };
}

void from_json(const json& j, IndexRecord& record) {
    j.at("url").get_to(record.url);
    j.at("filename").get_to(record.segmentFilename);
    j.at("offset").get_to(record.offset);
    j.at("length").get_to(record.length);
    ReadOptional(j, "mimeType", record.mimeType);
    ReadOptional(j, "statusCode", record.statusCode);
    ReadOptional(j, "digest", record.contentDigest);
    ReadOptional(j, "timestamp", record.captureTimestamp);
}

void to_json(json& j, const ArchiveRecord& record) {
    j = json{
        {"recordId", record.recordId},
        {"recordType", record.recordType},
        {"targetUri", record.targetUri},
        {"date", record.date},
        {"contentType", record.contentType},
        {"contentLength", record.contentLength},
        {"payloadLength", record.payload ? record.payload->size() : 0}
    };
    if (record.httpHeaders) {
        j["httpHeaders"] = *record.httpHeaders;
    }
}

void to_json(json& j, const HttpResponse& response) {
    j = json{
        {"statusCode", response.statusCode},
        {"statusInferred", response.statusInferred},
        {"headers", response.headers},
        {"body", response.body}
    };
}

void to_json(json& j, const PageContent& page) {
    j = json{
        {"url", page.url},
        {"snapshotId", page.snapshotId},
        {"statusCode", page.statusCode},
        {"statusInferred", page.statusInferred},
        {"headers", page.headers},
        {"body", page.body},
        {"mimeType", page.mimeType},
        {"timestamp", page.captureTimestamp},
        {"length", page.length}
    };
}

void from_json(const json& j, PageContent& page) {
    j.at("url").get_to(page.url);
    j.at("snapshotId").get_to(page.snapshotId);
    j.at("statusCode").get_to(page.statusCode);
    j.at("body").get_to(page.body);
    ReadOptional(j, "statusInferred", page.statusInferred);
    ReadOptional(j, "headers", page.headers);
    ReadOptional(j, "mimeType", page.mimeType);
    ReadOptional(j, "timestamp", page.captureTimestamp);
    ReadOptional(j, "length", page.length);
}

void to_json(json& j, const TechnologyReport& report) {
    j = json{
        {"domain", report.domain},
        {"snapshotId", report.snapshotId},
        {"pagesAnalyzed", report.pagesAnalyzed},
        {"pagesAttempted", report.pagesAttempted},
        {"technologyCounts", report.technologyCounts},
        {"categoryBreakdown", report.categoryBreakdown},
        {"adoptionPercentage", report.adoptionPercentage}
    };
}

void from_json(const json& j, TechnologyReport& report) {
    j.at("domain").get_to(report.domain);
    j.at("snapshotId").get_to(report.snapshotId);
    j.at("pagesAnalyzed").get_to(report.pagesAnalyzed);
    j.at("pagesAttempted").get_to(report.pagesAttempted);
    j.at("technologyCounts").get_to(report.technologyCounts);
    j.at("categoryBreakdown").get_to(report.categoryBreakdown);
    j.at("adoptionPercentage").get_to(report.adoptionPercentage);
}

void to_json(json& j, const LinkGraph& graph) {
    j = json{
        {"domain", graph.domain},
        {"snapshotId", graph.snapshotId},
        {"pagesAnalyzed", graph.pagesAnalyzed},
        {"pagesAttempted", graph.pagesAttempted},
        {"nodes", graph.nodes},
        {"edges", graph.edges},
        {"hubPages", graph.hubPages},
        {"pagerank", graph.pagerank}
    };
}

void from_json(const json& j, LinkGraph& graph) {
    j.at("domain").get_to(graph.domain);
    j.at("snapshotId").get_to(graph.snapshotId);
    j.at("pagesAnalyzed").get_to(graph.pagesAnalyzed);
    j.at("pagesAttempted").get_to(graph.pagesAttempted);
    j.at("nodes").get_to(graph.nodes);
    j.at("edges").get_to(graph.edges);
    j.at("hubPages").get_to(graph.hubPages);
    j.at("pagerank").get_to(graph.pagerank);
}

void to_json(json& j, const KeywordStats& stats) {
    j = json{
        {"domain", stats.domain},
        {"snapshotId", stats.snapshotId},
        {"pagesAnalyzed", stats.pagesAnalyzed},
        {"pagesAttempted", stats.pagesAttempted},
        {"keywords", stats.keywords},
        {"frequencies", stats.frequencies},
        {"totalOccurrences", stats.totalOccurrences},
        {"tfidfScores", stats.tfidfScores}
    };
}

void from_json(const json& j, KeywordStats& stats) {
    j.at("domain").get_to(stats.domain);
    j.at("snapshotId").get_to(stats.snapshotId);
    j.at("pagesAnalyzed").get_to(stats.pagesAnalyzed);
    j.at("pagesAttempted").get_to(stats.pagesAttempted);
    j.at("keywords").get_to(stats.keywords);
    j.at("frequencies").get_to(stats.frequencies);
    j.at("totalOccurrences").get_to(stats.totalOccurrences);
    j.at("tfidfScores").get_to(stats.tfidfScores);
}

void to_json(json& j, const DomainTimeline& timeline) {
    j = json{
        {"domain", timeline.domain},
        {"snapshots", timeline.snapshots},
        {"pageCounts", timeline.pageCounts},
        {"sizeBytes", timeline.sizeBytes},
        {"technologiesAdded", timeline.technologiesAdded},
        {"technologiesRemoved", timeline.technologiesRemoved}
    };
}

void from_json(const json& j, DomainTimeline& timeline) {
    j.at("domain").get_to(timeline.domain);
    j.at("snapshots").get_to(timeline.snapshots);
    j.at("pageCounts").get_to(timeline.pageCounts);
    j.at("sizeBytes").get_to(timeline.sizeBytes);
    j.at("technologiesAdded").get_to(timeline.technologiesAdded);
    j.at("technologiesRemoved").get_to(timeline.technologiesRemoved);
}

void to_json(json& j, const HeaderReport& report) {
    j = json{
        {"domain", report.domain},
        {"snapshotId", report.snapshotId},
        {"pagesAnalyzed", report.pagesAnalyzed},
        {"pagesAttempted", report.pagesAttempted},
        {"securityHeaderAdoption", report.securityHeaderAdoption},
        {"cachingPolicyCounts", report.cachingPolicyCounts},
        {"serverCounts", report.serverCounts},
        {"securityScore", report.securityScore},
        {"recommendations", report.recommendations}
    };
}

void from_json(const json& j, HeaderReport& report) {
    j.at("domain").get_to(report.domain);
    j.at("snapshotId").get_to(report.snapshotId);
    j.at("pagesAnalyzed").get_to(report.pagesAnalyzed);
    j.at("pagesAttempted").get_to(report.pagesAttempted);
    j.at("securityHeaderAdoption").get_to(report.securityHeaderAdoption);
    j.at("cachingPolicyCounts").get_to(report.cachingPolicyCounts);
    j.at("serverCounts").get_to(report.serverCounts);
    j.at("securityScore").get_to(report.securityScore);
    j.at("recommendations").get_to(report.recommendations);
}

} // namespace crawlscope::domain

namespace crawlscope::infrastructure {

std::string ToDisplayJson(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace crawlscope::infrastructure
