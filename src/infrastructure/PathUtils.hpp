// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace crawlscope::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();
    /** @brief Default project root holding settings.json. */
    static std::filesystem::path GetProjectRoot();
};

} // namespace crawlscope::infrastructure
