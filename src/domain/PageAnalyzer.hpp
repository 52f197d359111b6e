/**
 * @file PageAnalyzer.hpp
 * @brief Per-page signal extraction supplied by the HTML analysis layer.
 */

#pragma once
#include <string>
#include <vector>
#include "PageContent.hpp"

namespace crawlscope::domain {

/**
 * @struct DetectedTechnology
 * @brief A technology fingerprinted on a page.
 */
struct DetectedTechnology {
    std::string name;
    std::string category;
};

/**
 * @class PageAnalyzer
 * @brief Abstract analyzer run concurrently over fetched pages.
 *
 * Implementations must be idempotent and free of side effects: the engine
 * calls them from several worker threads and may memoize their results.
 */
class PageAnalyzer {
public:
    virtual ~PageAnalyzer() = default;

    /** @brief Technologies detected on the page. */
    virtual std::vector<DetectedTechnology> detectTechnologies(const PageContent& page) = 0;

    /** @brief Absolute URLs of links from this page to the same site. */
    virtual std::vector<std::string> extractInternalLinks(const PageContent& page) = 0;

    /** @brief Visible text of the page. */
    virtual std::string extractText(const PageContent& page) = 0;
};

} // namespace crawlscope::domain
