/**
 * @file CrawlscopeApp.hpp
 * @brief Command-line driver for crawlscope.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include "application/AppServices.hpp"

namespace crawlscope::app {

/**
 * @class CrawlscopeApp
 * @brief Composition root and command dispatcher.
 *
 * Builds every service from the configuration, runs one command and prints
 * its result as JSON on stdout. Diagnostics go to stderr.
 */
class CrawlscopeApp {
public:
    /**
     * @brief Wires the services.
     * @throws std::runtime_error when the cache cannot be initialized.
     */
    explicit CrawlscopeApp(const infrastructure::AppConfig& config);

    /**
     * @brief Runs the command in @p args (program name excluded).
     * @return Exit code (0 for success).
     */
    int Run(const std::vector<std::string>& args);

    static void PrintUsage();

private:
    struct CommandLine {
        std::string command;
        std::vector<std::string> positional;
        std::map<std::string, std::string> options; ///< "--name value" pairs without the dashes.
    };

    static std::optional<CommandLine> Parse(const std::vector<std::string>& args);
    static int IntOption(const CommandLine& cmd, const std::string& name, int fallback);

    int Snapshots();
    int Latest();
    int Search(const CommandLine& cmd);
    int Fetch(const CommandLine& cmd);
    int Records(const CommandLine& cmd);
    int Headers(const CommandLine& cmd);
    int CacheStats();
    int CacheClear();

    application::AppServices m_services;
};

} // namespace crawlscope::app
