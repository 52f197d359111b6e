/**
 * @file UrlUtils.hpp
 * @brief Splitting of configured service URLs for httplib clients.
 */

#pragma once
#include <string>

namespace crawlscope::infrastructure {

/**
 * @struct ServiceUrl
 * @brief A base URL split into the part httplib::Client takes
 *        (scheme://host[:port]) and the path prefix requests must carry.
 */
struct ServiceUrl {
    std::string origin;     ///< e.g. "https://index.commoncrawl.org"
    std::string pathPrefix; ///< "" or "/prefix" without a trailing slash

    /** @brief Prefixes @p path (which starts with '/'). */
    std::string path(const std::string& path) const { return pathPrefix + path; }
};

class UrlUtils {
public:
    /** @brief Splits @p url; a missing scheme defaults to http. */
    static ServiceUrl Split(const std::string& url);

    /** @brief Host component of an absolute URL, lowercased; empty if none. */
    static std::string Host(const std::string& url);
};

} // namespace crawlscope::infrastructure
