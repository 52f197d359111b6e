/**
 * @file PageSource.hpp
 * @brief Interface for materializing archived pages.
 */

#pragma once
#include <string>
#include <optional>
#include "PageContent.hpp"

namespace crawlscope::domain {

/**
 * @class PageSource
 * @brief Produces the archived content of a single URL in a snapshot.
 */
class PageSource {
public:
    virtual ~PageSource() = default;

    /**
     * @brief Fetches one page.
     * @return The page, or nullopt when it is not in the archive.
     *
     * Transport failures may surface as exceptions; batch callers treat them
     * like any other per-page failure.
     */
    virtual std::optional<PageContent> fetchPage(const std::string& url, const std::string& snapshotId) = 0;
};

} // namespace crawlscope::domain
