#include "infrastructure/UrlUtils.hpp"
#include <algorithm>
#include <cctype>

namespace crawlscope::infrastructure {

ServiceUrl UrlUtils::Split(const std::string& url) {
    ServiceUrl result;
    std::string rest = url;
    std::string scheme = "http";

    auto schemeEnd = rest.find("://");
    if (schemeEnd != std::string::npos) {
        scheme = rest.substr(0, schemeEnd);
        rest = rest.substr(schemeEnd + 3);
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : rest.substr(slash);
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    result.origin = scheme + "://" + authority;
    result.pathPrefix = path;
    return result;
}

std::string UrlUtils::Host(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) return "";
    std::string rest = url.substr(schemeEnd + 3);
    std::string authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    authority = authority.substr(0, authority.find(':'));
    std::transform(authority.begin(), authority.end(), authority.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return authority;
}

} // namespace crawlscope::infrastructure
