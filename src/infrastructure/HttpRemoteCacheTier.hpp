/**
 * @file HttpRemoteCacheTier.hpp
 * @brief RemoteCacheTier over a plain HTTP key/value service.
 */

#pragma once
#include "infrastructure/RemoteCacheTier.hpp"
#include "infrastructure/UrlUtils.hpp"

namespace crawlscope::infrastructure {

/**
 * @class HttpRemoteCacheTier
 * @brief Stores values under "<url>/cc:<hash>".
 *
 * GET returns the value (404 is a miss), PUT with a "ttl" query parameter
 * stores it, and DELETE on "<url>/cc:" drops every key of this namespace.
 */
class HttpRemoteCacheTier : public RemoteCacheTier {
public:
    explicit HttpRemoteCacheTier(const std::string& url, int timeoutSeconds = 5);

    std::optional<std::string> get(const std::string& keyHash) override;
    void set(const std::string& keyHash, const std::string& value, int ttlSeconds) override;
    void clear() override;

private:
    std::string keyPath(const std::string& keyHash) const;

    ServiceUrl m_url;
    int m_timeoutSeconds;
};

} // namespace crawlscope::infrastructure
