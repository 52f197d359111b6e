#include "infrastructure/HttpRemoteCacheTier.hpp"
#include <httplib.h>
#include <stdexcept>

namespace crawlscope::infrastructure {

namespace {
constexpr const char* kKeyPrefix = "/cc:";

std::runtime_error TransportError(const std::string& op, const httplib::Result& res) {
    if (!res) {
        return std::runtime_error("remote cache " + op + " failed: " + httplib::to_string(res.error()));
    }
    return std::runtime_error("remote cache " + op + " returned HTTP " + std::to_string(res->status));
}
}

HttpRemoteCacheTier::HttpRemoteCacheTier(const std::string& url, int timeoutSeconds)
    : m_url(UrlUtils::Split(url)), m_timeoutSeconds(timeoutSeconds) {}

std::string HttpRemoteCacheTier::keyPath(const std::string& keyHash) const {
    return m_url.path(kKeyPrefix + keyHash);
}

std::optional<std::string> HttpRemoteCacheTier::get(const std::string& keyHash) {
    httplib::Client cli(m_url.origin);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    auto res = cli.Get(keyPath(keyHash));
    if (res && res->status == 200) {
        return res->body;
    }
    if (res && res->status == 404) {
        return std::nullopt;
    }
    throw TransportError("GET", res);
}

void HttpRemoteCacheTier::set(const std::string& keyHash, const std::string& value, int ttlSeconds) {
    httplib::Client cli(m_url.origin);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_write_timeout(m_timeoutSeconds);

    std::string path = keyPath(keyHash) + "?ttl=" + std::to_string(ttlSeconds);
    auto res = cli.Put(path, value, "application/octet-stream");
    if (!res || res->status / 100 != 2) {
        throw TransportError("PUT", res);
    }
}

void HttpRemoteCacheTier::clear() {
    httplib::Client cli(m_url.origin);
    cli.set_connection_timeout(m_timeoutSeconds);

    auto res = cli.Delete(m_url.path(kKeyPrefix));
    if (!res || (res->status / 100 != 2 && res->status != 404)) {
        throw TransportError("DELETE", res);
    }
}

} // namespace crawlscope::infrastructure
