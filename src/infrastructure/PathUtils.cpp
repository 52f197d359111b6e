#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace crawlscope::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".cache";
    }
    return fs::current_path();
}

fs::path PathUtils::GetProjectRoot() {
    const char* root = std::getenv("CRAWLSCOPE_HOME");
    if (root && *root) {
        return fs::path(root);
    }
    return GetConfigHome() / "crawlscope";
}

} // namespace crawlscope::infrastructure
