/**
 * @file ArchiveObjectClient.hpp
 * @brief Anonymous client for the public segment-file bucket.
 */

#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <memory>
#include <functional>
#include <atomic>
#include <cstdint>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/RequestThrottle.hpp"
#include "infrastructure/UrlUtils.hpp"

namespace crawlscope::infrastructure {

/** @brief Receives streamed chunks in order; return false to stop the transfer. */
using ChunkSink = std::function<bool(std::string_view chunk)>;

/**
 * @class ArchiveObjectClient
 * @brief Reads objects by key with path-style HTTP GETs.
 *
 * Existence and size come from a one-byte range probe because anonymous
 * callers cannot issue metadata requests. 403 and 404 both mean "missing".
 * Every transfer holds a RequestThrottle permit and adds to the byte counter
 * behind the cost estimate.
 */
class ArchiveObjectClient {
public:
    ArchiveObjectClient(const ObjectStoreConfig& config, std::shared_ptr<RequestThrottle> throttle);

    bool exists(const std::string& objectKey);

    /** @brief Total object size, or nullopt when the object is missing. */
    std::optional<uint64_t> size(const std::string& objectKey);

    std::optional<std::string> download(const std::string& objectKey);

    /** @brief Bytes [start, end] of the object, both ends inclusive. */
    std::optional<std::string> downloadRange(const std::string& objectKey, uint64_t start, uint64_t end);

    /** @brief Whole object, gunzipped; returned as-is if it is not gzip. */
    std::optional<std::string> downloadAndDecompress(const std::string& objectKey);

    /**
     * @brief Streams raw object bytes to @p sink.
     * @return false if the object could not be read to the end.
     */
    bool stream(const std::string& objectKey, const ChunkSink& sink);

    /**
     * @brief Streams the object through a gzip inflater.
     *
     * If the first chunk does not inflate, the object is passed through raw.
     * A later inflate error is logged and the rest is passed through raw too.
     */
    bool streamDecompressed(const std::string& objectKey, const ChunkSink& sink);

    uint64_t bytesTransferred() const { return m_bytesTransferred.load(); }
    double estimatedCostUsd() const;
    void resetCostTracking();

private:
    struct ProbeResult {
        int status = 0;
        uint64_t totalSize = 0;
    };

    /** @brief nullopt when the object is missing or the probe failed. */
    std::optional<ProbeResult> probe(const std::string& objectKey);
    std::string objectPath(const std::string& objectKey) const;

    ObjectStoreConfig m_config;
    ServiceUrl m_url;
    std::shared_ptr<RequestThrottle> m_throttle;
    std::atomic<uint64_t> m_bytesTransferred{0};
};

} // namespace crawlscope::infrastructure
