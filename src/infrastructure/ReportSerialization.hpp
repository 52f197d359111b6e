/**
 * @file ReportSerialization.hpp
 * @brief JSON mapping of domain types and the tagged cache envelope.
 */

#pragma once
#include <string>
#include <optional>
#include <iostream>
#include <nlohmann/json.hpp>
#include "domain/CrawlSnapshot.hpp"
#include "domain/IndexRecord.hpp"
#include "domain/ArchiveRecord.hpp"
#include "domain/PageContent.hpp"
#include "domain/Reports.hpp"

namespace crawlscope::domain {

void to_json(nlohmann::json& j, const CrawlSnapshot& snapshot);
void to_json(nlohmann::json& j, const IndexRecord& record);
void from_json(const nlohmann::json& j, IndexRecord& record);

/** @brief Record metadata; the payload is summarized by its length. */
void to_json(nlohmann::json& j, const ArchiveRecord& record);

void to_json(nlohmann::json& j, const HttpResponse& response);

void to_json(nlohmann::json& j, const PageContent& page);
void from_json(const nlohmann::json& j, PageContent& page);

void to_json(nlohmann::json& j, const TechnologyReport& report);
void from_json(const nlohmann::json& j, TechnologyReport& report);

void to_json(nlohmann::json& j, const LinkGraph& graph);
void from_json(const nlohmann::json& j, LinkGraph& graph);

void to_json(nlohmann::json& j, const KeywordStats& stats);
void from_json(const nlohmann::json& j, KeywordStats& stats);

void to_json(nlohmann::json& j, const DomainTimeline& timeline);
void from_json(const nlohmann::json& j, DomainTimeline& timeline);

void to_json(nlohmann::json& j, const HeaderReport& report);
void from_json(const nlohmann::json& j, HeaderReport& report);

} // namespace crawlscope::domain

namespace crawlscope::infrastructure {

/**
 * @brief Serializes @p value as {"kind": kind, "data": value} in CBOR.
 *
 * CBOR keeps page bodies byte-exact even when they are not valid UTF-8.
 */
template <typename T>
std::string EncodeEnvelope(const std::string& kind, const T& value) {
    nlohmann::json envelope = {{"kind", kind}, {"data", value}};
    std::vector<std::uint8_t> bytes = nlohmann::json::to_cbor(envelope);
    return std::string(bytes.begin(), bytes.end());
}

/** @brief Inverse of EncodeEnvelope; nullopt on a kind mismatch or bad blob. */
template <typename T>
std::optional<T> DecodeEnvelope(const std::string& kind, const std::string& blob) {
    try {
        nlohmann::json envelope = nlohmann::json::from_cbor(blob);
        if (!envelope.is_object() || envelope.value("kind", "") != kind) {
            return std::nullopt;
        }
        return envelope.at("data").get<T>();
    } catch (const std::exception& e) {
        std::cerr << "[ReportSerialization] Discarding unreadable cached " << kind << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

/** @brief Pretty JSON for console output; invalid UTF-8 is replaced. */
std::string ToDisplayJson(const nlohmann::json& j);

} // namespace crawlscope::infrastructure
