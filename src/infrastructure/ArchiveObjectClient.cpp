#include "infrastructure/ArchiveObjectClient.hpp"
#include "infrastructure/GzipCodec.hpp"
#include <httplib.h>
#include <iostream>

namespace crawlscope::infrastructure {

namespace {

// Total length from "bytes a-b/N" or "bytes */N"; nullopt if absent or unknown
std::optional<uint64_t> ParseContentRangeTotal(const std::string& header) {
    auto slash = header.rfind('/');
    if (slash == std::string::npos || slash + 1 >= header.size()) {
        return std::nullopt;
    }
    std::string total = header.substr(slash + 1);
    if (total == "*") {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(total));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void LogFailure(const char* what, const std::string& key, const httplib::Result& res) {
    if (res) {
        std::cerr << "[ArchiveObjectClient] " << what << " " << key << " failed: HTTP " << res->status << std::endl;
    } else {
        std::cerr << "[ArchiveObjectClient] " << what << " " << key << " failed: "
                  << httplib::to_string(res.error()) << std::endl;
    }
}

} // namespace

ArchiveObjectClient::ArchiveObjectClient(const ObjectStoreConfig& config, std::shared_ptr<RequestThrottle> throttle)
    : m_config(config), m_url(UrlUtils::Split(config.endpoint)), m_throttle(std::move(throttle)) {
    if (!m_throttle) {
        m_throttle = std::make_shared<RequestThrottle>(1, 0.0);
    }
}

std::string ArchiveObjectClient::objectPath(const std::string& objectKey) const {
    return m_url.path("/" + m_config.bucket + "/" + objectKey);
}

std::optional<ArchiveObjectClient::ProbeResult> ArchiveObjectClient::probe(const std::string& objectKey) {
    auto permit = m_throttle->acquire();
    httplib::Client cli(m_url.origin);
    cli.set_connection_timeout(m_config.timeoutSeconds);
    cli.set_read_timeout(m_config.timeoutSeconds);

    auto res = cli.Get(objectPath(objectKey), httplib::Headers{{"Range", "bytes=0-0"}});
    if (!res) {
        LogFailure("Probe", objectKey, res);
        return std::nullopt;
    }

    ProbeResult result;
    result.status = res->status;
    switch (res->status) {
        case 206: {
            auto total = ParseContentRangeTotal(res->get_header_value("Content-Range"));
            result.totalSize = total.value_or(res->body.size());
            return result;
        }
        case 200: {
            // Range ignored by the server: the whole object came back
            if (res->has_header("Content-Length")) {
                try {
                    result.totalSize = std::stoull(res->get_header_value("Content-Length"));
                    return result;
                } catch (const std::exception&) {
                    // fall back to the body size
                }
            }
            result.totalSize = res->body.size();
            return result;
        }
        case 416:
            // Range not satisfiable: the object exists but is empty
            result.totalSize = ParseContentRangeTotal(res->get_header_value("Content-Range")).value_or(0);
            return result;
        case 403:
        case 404:
            return std::nullopt;
        default:
            LogFailure("Probe", objectKey, res);
            return std::nullopt;
    }
}

bool ArchiveObjectClient::exists(const std::string& objectKey) {
    return probe(objectKey).has_value();
}

std::optional<uint64_t> ArchiveObjectClient::size(const std::string& objectKey) {
    auto result = probe(objectKey);
    if (!result) {
        return std::nullopt;
    }
    return result->totalSize;
}

std::optional<std::string> ArchiveObjectClient::download(const std::string& objectKey) {
    auto permit = m_throttle->acquire();
    httplib::Client cli(m_url.origin);
    cli.set_connection_timeout(m_config.timeoutSeconds);
    cli.set_read_timeout(m_config.timeoutSeconds);

    std::cerr << "[ArchiveObjectClient] Downloading " << m_config.bucket << "/" << objectKey << std::endl;
    auto res = cli.Get(objectPath(objectKey));
    if (res && res->status == 200) {
        m_bytesTransferred += res->body.size();
        return res->body;
    }
    LogFailure("Download", objectKey, res);
    return std::nullopt;
}

std::optional<std::string> ArchiveObjectClient::downloadRange(const std::string& objectKey, uint64_t start, uint64_t end) {
    if (end < start) {
        return std::nullopt;
    }

    auto permit = m_throttle->acquire();
    httplib::Client cli(m_url.origin);
    cli.set_connection_timeout(m_config.timeoutSeconds);
    cli.set_read_timeout(m_config.timeoutSeconds);

    std::string range = "bytes=" + std::to_string(start) + "-" + std::to_string(end);
    auto res = cli.Get(objectPath(objectKey), httplib::Headers{{"Range", range}});
    if (res && res->status == 206) {
        m_bytesTransferred += res->body.size();
        return res->body;
    }
    if (res && res->status == 200) {
        // Server ignored the range; cut it out of the full body
        m_bytesTransferred += res->body.size();
        if (start >= res->body.size()) {
            return std::string();
        }
        return res->body.substr(static_cast<size_t>(start), static_cast<size_t>(end - start + 1));
    }
    LogFailure("Range download", objectKey, res);
    return std::nullopt;
}

std::optional<std::string> ArchiveObjectClient::downloadAndDecompress(const std::string& objectKey) {
    auto data = download(objectKey);
    if (!data) {
        return std::nullopt;
    }
    if (auto inflated = GzipCodec::Decompress(*data)) {
        std::cerr << "[ArchiveObjectClient] Decompressed " << data->size() << " -> " << inflated->size() << " bytes" << std::endl;
        return inflated;
    }
    std::cerr << "[ArchiveObjectClient] " << objectKey << " is not gzipped, returning as-is" << std::endl;
    return data;
}

bool ArchiveObjectClient::stream(const std::string& objectKey, const ChunkSink& sink) {
    auto permit = m_throttle->acquire();
    httplib::Client cli(m_url.origin);
    cli.set_connection_timeout(m_config.timeoutSeconds);
    cli.set_read_timeout(m_config.timeoutSeconds);

    bool stoppedBySink = false;
    auto res = cli.Get(objectPath(objectKey), httplib::Headers{},
        [](const httplib::Response& response) {
            return response.status == 200;
        },
        [&](const char* data, size_t length) {
            m_bytesTransferred += length;
            if (!sink(std::string_view(data, length))) {
                stoppedBySink = true;
                return false;
            }
            return true;
        });

    if (stoppedBySink) {
        return true;
    }
    if (res && res->status == 200) {
        return true;
    }
    LogFailure("Stream", objectKey, res);
    return false;
}

bool ArchiveObjectClient::streamDecompressed(const std::string& objectKey, const ChunkSink& sink) {
    enum class Mode { Detect, Inflate, Raw };
    Mode mode = Mode::Detect;
    GzipInflater inflater;

    return stream(objectKey, [&](std::string_view chunk) {
        if (mode == Mode::Raw) {
            return sink(chunk);
        }

        std::string out;
        if (inflater.feed(chunk, out)) {
            mode = Mode::Inflate;
            return out.empty() ? true : sink(out);
        }

        if (mode == Mode::Detect) {
            std::cerr << "[ArchiveObjectClient] " << objectKey << " is not gzipped, streaming raw bytes" << std::endl;
            mode = Mode::Raw;
            return sink(chunk);
        }

        std::cerr << "[ArchiveObjectClient] Decompression error in " << objectKey
                  << ", passing the remainder through raw" << std::endl;
        mode = Mode::Raw;
        if (!out.empty() && !sink(out)) {
            return false;
        }
        return sink(chunk);
    });
}

double ArchiveObjectClient::estimatedCostUsd() const {
    const double gigabytes = static_cast<double>(m_bytesTransferred.load()) / (1024.0 * 1024.0 * 1024.0);
    return gigabytes * m_config.costPerGbUsd;
}

void ArchiveObjectClient::resetCostTracking() {
    m_bytesTransferred = 0;
    std::cerr << "[ArchiveObjectClient] Reset cost tracking" << std::endl;
}

} // namespace crawlscope::infrastructure
