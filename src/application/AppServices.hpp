/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/RequestThrottle.hpp"
#include "infrastructure/CacheManager.hpp"
#include "infrastructure/ArchiveIndexClient.hpp"
#include "infrastructure/ArchiveObjectClient.hpp"
#include "infrastructure/RecordParser.hpp"
#include "application/PageFetcher.hpp"
#include "application/AggregationEngine.hpp"

namespace crawlscope::application {

struct AppServices {
    infrastructure::AppConfig config;
    std::shared_ptr<infrastructure::RequestThrottle> throttle; ///< Shared by the index and object clients.
    std::shared_ptr<infrastructure::CacheManager> cache;
    std::shared_ptr<infrastructure::ArchiveIndexClient> indexClient;
    std::shared_ptr<infrastructure::ArchiveObjectClient> objectClient;
    std::shared_ptr<infrastructure::RecordParser> recordParser;
    std::shared_ptr<PageFetcher> pageFetcher;
    std::unique_ptr<AggregationEngine> aggregationEngine;
};

} // namespace crawlscope::application
