#include <iostream>
#include <string>
#include <vector>

#include "app/CrawlscopeApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace crawlscope;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
        app::CrawlscopeApp::PrintUsage();
        return args.empty() ? 2 : 0;
    }

    const std::string projectRoot = infrastructure::PathUtils::GetProjectRoot().string();
    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(projectRoot);

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "[Config] " << problem << std::endl;
        }
        return 1;
    }

    try {
        app::CrawlscopeApp application(config);
        return application.Run(args);
    } catch (const std::exception& e) {
        std::cerr << "[Crawlscope] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
