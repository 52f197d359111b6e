#include "infrastructure/ArchiveIndexClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <iostream>
#include <ctime>
#include <algorithm>

namespace crawlscope::infrastructure {

using json = nlohmann::json;

namespace {

std::string AsString(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

long long AsInteger(const json& value) {
    if (value.is_number_integer()) return value.get<long long>();
    if (value.is_number()) return static_cast<long long>(value.get<double>());
    return std::stoll(value.get<std::string>());
}

std::time_t UtcToTime(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

} // namespace

ArchiveIndexClient::ArchiveIndexClient(const IndexConfig& config, std::shared_ptr<RequestThrottle> throttle)
    : m_config(config), m_url(UrlUtils::Split(config.serverUrl)), m_throttle(std::move(throttle)) {
    if (!m_throttle) {
        m_throttle = std::make_shared<RequestThrottle>(1, 0.0);
    }
}

std::optional<std::string> ArchiveIndexClient::fetchText(const std::string& path, const QueryParams& query) {
    httplib::Params params;
    for (const auto& [key, value] : query) {
        params.emplace(key, value);
    }

    auto permit = m_throttle->acquire();
    httplib::Client cli(m_url.origin);
    cli.set_connection_timeout(m_config.timeoutSeconds);
    cli.set_read_timeout(m_config.timeoutSeconds);
    cli.set_follow_location(true);

    auto res = cli.Get(m_url.path(path), params, httplib::Headers{});
    if (res && res->status == 200) {
        return res->body;
    }
    if (res && res->status == 404) {
        std::cerr << "[ArchiveIndexClient] Not found: " << path << std::endl;
    } else if (res) {
        std::cerr << "[ArchiveIndexClient] HTTP Error " << res->status << " for " << path << std::endl;
    } else {
        std::cerr << "[ArchiveIndexClient] Connection failed for " << path << ": "
                  << httplib::to_string(res.error()) << std::endl;
    }
    return std::nullopt;
}

std::chrono::system_clock::time_point ArchiveIndexClient::DecodeSnapshotDate(const std::string& snapshotId) {
    std::vector<std::string> parts;
    std::stringstream ss(snapshotId);
    std::string part;
    while (std::getline(ss, part, '-')) {
        parts.push_back(part);
    }

    try {
        if (parts.size() >= 3) {
            int year = std::stoi(parts[2]);
            int week = parts.size() > 3 ? std::stoi(parts[3]) : 1;
            if (year < 1970 || week < 1 || week > 53) {
                return std::chrono::system_clock::now();
            }
            std::tm tm{};
            tm.tm_year = year - 1900;
            tm.tm_mon = 0;
            tm.tm_mday = 1;
            auto janFirst = std::chrono::system_clock::from_time_t(UtcToTime(&tm));
            return janFirst + std::chrono::hours(24 * 7 * (week - 1));
        }
    } catch (const std::exception&) {
        // Non-numeric year or week: fall through to now
    }
    return std::chrono::system_clock::now();
}

std::vector<domain::CrawlSnapshot> ArchiveIndexClient::listSnapshots() {
    std::vector<domain::CrawlSnapshot> snapshots;
    auto body = fetchText("/collinfo.json", {});
    if (!body) {
        return snapshots;
    }

    try {
        auto data = json::parse(*body);
        if (!data.is_array()) {
            std::cerr << "[ArchiveIndexClient] Unexpected collinfo.json shape" << std::endl;
            return snapshots;
        }
        for (const auto& item : data) {
            if (!item.is_object()) continue;
            domain::CrawlSnapshot snapshot;
            snapshot.id = item.value("id", "");
            snapshot.name = item.value("name", snapshot.id);
            snapshot.date = DecodeSnapshotDate(snapshot.id);
            snapshot.status = domain::SnapshotStatus::Complete;
            snapshots.push_back(std::move(snapshot));
        }
    } catch (const std::exception& e) {
        std::cerr << "[ArchiveIndexClient] Error listing snapshots: " << e.what() << std::endl;
        snapshots.clear();
    }

    std::cerr << "[ArchiveIndexClient] Retrieved " << snapshots.size() << " snapshots" << std::endl;
    return snapshots;
}

std::optional<std::string> ArchiveIndexClient::latestSnapshot() {
    auto snapshots = listSnapshots();
    if (snapshots.empty()) {
        return std::nullopt;
    }
    auto latest = std::max_element(snapshots.begin(), snapshots.end(),
        [](const domain::CrawlSnapshot& a, const domain::CrawlSnapshot& b) { return a.date < b.date; });
    return latest->id;
}

std::string ArchiveIndexClient::resolveSnapshot(const std::optional<std::string>& snapshotId) {
    if (snapshotId && !snapshotId->empty()) {
        return *snapshotId;
    }
    if (auto latest = latestSnapshot()) {
        return *latest;
    }
    return m_config.defaultSnapshot;
}

std::optional<domain::IndexRecord> ArchiveIndexClient::ParseRecordLine(const std::string& line) {
    try {
        auto data = json::parse(line);
        domain::IndexRecord record;
        if (data.is_array()) {
            if (data.size() < 9) {
                return std::nullopt;
            }
            record.captureTimestamp = AsString(data[1]);
            record.url = AsString(data[2]);
            record.mimeType = AsString(data[3]);
            record.statusCode = static_cast<int>(AsInteger(data[4]));
            record.contentDigest = AsString(data[5]);
            record.length = static_cast<uint64_t>(AsInteger(data[6]));
            record.offset = static_cast<uint64_t>(AsInteger(data[7]));
            record.segmentFilename = AsString(data[8]);
        } else if (data.is_object()) {
            if (!data.contains("url") || !data.contains("filename") ||
                !data.contains("offset") || !data.contains("length")) {
                return std::nullopt;
            }
            record.url = AsString(data["url"]);
            record.captureTimestamp = data.contains("timestamp") ? AsString(data["timestamp"]) : "";
            record.mimeType = data.contains("mime") ? AsString(data["mime"]) : "";
            record.statusCode = data.contains("status") ? static_cast<int>(AsInteger(data["status"])) : 0;
            record.contentDigest = data.contains("digest") ? AsString(data["digest"]) : "";
            record.length = static_cast<uint64_t>(AsInteger(data["length"]));
            record.offset = static_cast<uint64_t>(AsInteger(data["offset"]));
            record.segmentFilename = AsString(data["filename"]);
        } else {
            return std::nullopt;
        }
        return record;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<domain::IndexRecord> ArchiveIndexClient::ParseRecords(const std::string& body, int* nonEmptyLines) {
    std::vector<domain::IndexRecord> records;
    std::stringstream ss(body);
    std::string line;
    int lines = 0;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        ++lines;
        if (auto record = ParseRecordLine(line)) {
            records.push_back(std::move(*record));
        } else {
            std::cerr << "[ArchiveIndexClient] Skipping malformed index line: " << line.substr(0, 120) << std::endl;
        }
    }
    if (nonEmptyLines) *nonEmptyLines = lines;
    return records;
}

std::vector<domain::IndexRecord> ArchiveIndexClient::search(const std::string& query,
                                                            const std::optional<std::string>& snapshotId,
                                                            int limit,
                                                            domain::MatchType matchType) {
    if (limit <= 0) {
        return {};
    }
    const std::string snapshot = resolveSnapshot(snapshotId);

    QueryParams params = {
        {"url", query},
        {"output", "json"},
        {"limit", std::to_string(std::min(limit, m_config.maxResults))}
    };
    if (matchType != domain::MatchType::Exact) {
        params.emplace_back("matchType", domain::MatchTypeToString(matchType));
    }

    auto body = fetchText("/" + snapshot + "-index", params);
    if (!body) {
        return {};
    }
    auto records = ParseRecords(*body);
    std::cerr << "[ArchiveIndexClient] Found " << records.size() << " index records for " << query << std::endl;
    return records;
}

DomainRecordStream ArchiveIndexClient::streamDomain(const std::string& domainName,
                                                    const std::string& snapshotId,
                                                    std::optional<int> limit) {
    return DomainRecordStream(this, domainName, snapshotId, limit);
}

DomainRecordStream::DomainRecordStream(ArchiveIndexClient* client, std::string domain, std::string snapshotId,
                                       std::optional<int> limit)
    : m_client(client), m_domain(std::move(domain)), m_snapshotId(std::move(snapshotId)), m_limit(limit) {}

bool DomainRecordStream::fetchNextPage() {
    ArchiveIndexClient::QueryParams params = {
        {"url", m_domain},
        {"output", "json"},
        {"matchType", "domain"},
        {"limit", std::to_string(ArchiveIndexClient::kStreamPageSize)},
        {"page", std::to_string(m_page)}
    };

    auto body = m_client->fetchText("/" + m_snapshotId + "-index", params);
    if (!body) {
        std::cerr << "[ArchiveIndexClient] Stopping domain stream at page " << m_page << std::endl;
        return false;
    }

    int lines = 0;
    auto records = ArchiveIndexClient::ParseRecords(*body, &lines);
    ++m_page;
    if (lines == 0) {
        return false;
    }
    for (auto& record : records) {
        m_buffer.push_back(std::move(record));
    }
    return true;
}

std::optional<domain::IndexRecord> DomainRecordStream::next() {
    while (!m_done) {
        if (m_limit && m_yielded >= *m_limit) {
            m_done = true;
            break;
        }
        if (!m_buffer.empty()) {
            domain::IndexRecord record = std::move(m_buffer.front());
            m_buffer.pop_front();
            ++m_yielded;
            return record;
        }
        if (!fetchNextPage()) {
            m_done = true;
        }
    }
    return std::nullopt;
}

std::vector<domain::IndexRecord> DomainRecordStream::collect() {
    std::vector<domain::IndexRecord> records;
    while (auto record = next()) {
        records.push_back(std::move(*record));
    }
    return records;
}

} // namespace crawlscope::infrastructure
