/**
 * @file CrawlscopeApp.cpp
 * @brief Implementation of the command-line driver.
 */

#include "app/CrawlscopeApp.hpp"
#include "infrastructure/HttpRemoteCacheTier.hpp"
#include "infrastructure/ReportSerialization.hpp"
#include <iostream>

namespace crawlscope::app {

using json = nlohmann::json;

namespace {

void PrintJson(const json& j) {
    std::cout << infrastructure::ToDisplayJson(j) << std::endl;
}

std::optional<domain::MatchType> ParseMatchType(const std::string& value) {
    if (value == "exact") return domain::MatchType::Exact;
    if (value == "prefix") return domain::MatchType::Prefix;
    if (value == "domain") return domain::MatchType::Domain;
    if (value == "range") return domain::MatchType::Range;
    return std::nullopt;
}

} // namespace

CrawlscopeApp::CrawlscopeApp(const infrastructure::AppConfig& config) {
    // Composition root
    m_services.config = config;
    m_services.throttle = std::make_shared<infrastructure::RequestThrottle>(
        config.rateLimit.maxConcurrentRequests, config.rateLimit.requestsPerSecond);

    std::shared_ptr<infrastructure::RemoteCacheTier> remote;
    if (config.remoteCache.enabled && !config.remoteCache.url.empty()) {
        remote = std::make_shared<infrastructure::HttpRemoteCacheTier>(config.remoteCache.url);
    }

    infrastructure::CacheOptions cacheOptions;
    cacheOptions.directory = config.resolvedCacheDir();
    cacheOptions.maxSizeBytes = config.maxCacheBytes();
    cacheOptions.memoryBytes = config.memoryCacheBytes();
    cacheOptions.defaultTtlSeconds = config.cache.defaultTtlSeconds;
    cacheOptions.remoteTtlSeconds = config.remoteCache.ttlSeconds;
    m_services.cache = std::make_shared<infrastructure::CacheManager>(cacheOptions, remote);

    m_services.indexClient = std::make_shared<infrastructure::ArchiveIndexClient>(config.index, m_services.throttle);
    m_services.objectClient = std::make_shared<infrastructure::ArchiveObjectClient>(config.objectStore, m_services.throttle);
    m_services.recordParser = std::make_shared<infrastructure::RecordParser>();
    m_services.pageFetcher = std::make_shared<application::PageFetcher>(
        m_services.indexClient, m_services.objectClient, m_services.cache, config.index.defaultSnapshot);

    // Page analysis lives outside this tool; analyzer-backed reports are unavailable here
    m_services.aggregationEngine = std::make_unique<application::AggregationEngine>(
        m_services.indexClient, m_services.pageFetcher, nullptr, m_services.cache, config.aggregation);
}

void CrawlscopeApp::PrintUsage() {
    std::cerr <<
        "Usage: crawlscope <command> [arguments]\n"
        "\n"
        "Commands:\n"
        "  snapshots                          List crawl snapshots\n"
        "  latest                             Print the most recent snapshot id\n"
        "  search <query> [--snapshot ID] [--limit N] [--match exact|prefix|domain|range]\n"
        "  fetch <url> [--snapshot ID]        Fetch one archived page\n"
        "  records <objectKey> [--list N]     Count (and list) records of a segment file\n"
        "  headers <domain> [--snapshot ID] [--sample N]\n"
        "                                     Security/caching/server header survey\n"
        "  cache-stats                        Show cache statistics\n"
        "  cache-clear                        Remove every cache entry\n";
}

std::optional<CrawlscopeApp::CommandLine> CrawlscopeApp::Parse(const std::vector<std::string>& args) {
    if (args.empty()) {
        return std::nullopt;
    }
    CommandLine cmd;
    cmd.command = args[0];
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= args.size()) {
                std::cerr << "[CrawlscopeApp] Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            cmd.options[arg.substr(2)] = args[++i];
        } else {
            cmd.positional.push_back(arg);
        }
    }
    return cmd;
}

int CrawlscopeApp::IntOption(const CommandLine& cmd, const std::string& name, int fallback) {
    auto it = cmd.options.find(name);
    if (it == cmd.options.end()) {
        return fallback;
    }
    try {
        return std::stoi(it->second);
    } catch (const std::exception&) {
        std::cerr << "[CrawlscopeApp] Ignoring non-numeric --" << name << " " << it->second << std::endl;
        return fallback;
    }
}

int CrawlscopeApp::Run(const std::vector<std::string>& args) {
    auto cmd = Parse(args);
    if (!cmd) {
        PrintUsage();
        return 2;
    }

    if (cmd->command == "snapshots") return Snapshots();
    if (cmd->command == "latest") return Latest();
    if (cmd->command == "search") return Search(*cmd);
    if (cmd->command == "fetch") return Fetch(*cmd);
    if (cmd->command == "records") return Records(*cmd);
    if (cmd->command == "headers") return Headers(*cmd);
    if (cmd->command == "cache-stats") return CacheStats();
    if (cmd->command == "cache-clear") return CacheClear();

    std::cerr << "Unknown command: " << cmd->command << "\n";
    PrintUsage();
    return 2;
}

int CrawlscopeApp::Snapshots() {
    PrintJson(m_services.indexClient->listSnapshots());
    return 0;
}

int CrawlscopeApp::Latest() {
    auto latest = m_services.indexClient->latestSnapshot();
    if (!latest) {
        std::cerr << "No snapshots available" << std::endl;
        return 1;
    }
    std::cout << *latest << std::endl;
    return 0;
}

int CrawlscopeApp::Search(const CommandLine& cmd) {
    if (cmd.positional.empty()) {
        PrintUsage();
        return 2;
    }
    domain::MatchType matchType = domain::MatchType::Exact;
    auto match = cmd.options.find("match");
    if (match != cmd.options.end()) {
        auto parsed = ParseMatchType(match->second);
        if (!parsed) {
            std::cerr << "Invalid --match value: " << match->second << std::endl;
            return 2;
        }
        matchType = *parsed;
    }

    std::optional<std::string> snapshot;
    auto it = cmd.options.find("snapshot");
    if (it != cmd.options.end()) snapshot = it->second;

    auto records = m_services.indexClient->search(cmd.positional[0], snapshot, IntOption(cmd, "limit", 100), matchType);
    PrintJson(records);
    return 0;
}

int CrawlscopeApp::Fetch(const CommandLine& cmd) {
    if (cmd.positional.empty()) {
        PrintUsage();
        return 2;
    }
    auto it = cmd.options.find("snapshot");
    const std::string snapshot = it != cmd.options.end() ? it->second : "";

    auto page = m_services.pageFetcher->fetchPage(cmd.positional[0], snapshot);
    if (!page) {
        std::cerr << "Page not found in the archive: " << cmd.positional[0] << std::endl;
        return 1;
    }
    PrintJson(*page);
    return 0;
}

int CrawlscopeApp::Records(const CommandLine& cmd) {
    if (cmd.positional.empty()) {
        PrintUsage();
        return 2;
    }
    const std::string& key = cmd.positional[0];
    auto data = m_services.objectClient->download(key);
    if (!data) {
        std::cerr << "Object not found: " << key << std::endl;
        return 1;
    }

    json out = {
        {"objectKey", key},
        {"recordCounts", m_services.recordParser->countByType(*data)},
        {"bytesTransferred", m_services.objectClient->bytesTransferred()},
        {"estimatedCostUsd", m_services.objectClient->estimatedCostUsd()}
    };

    const int listLimit = IntOption(cmd, "list", 0);
    if (listLimit > 0) {
        json listed = json::array();
        auto reader = m_services.recordParser->parse(*data);
        while (static_cast<int>(listed.size()) < listLimit) {
            auto record = reader.next();
            if (!record) break;
            listed.push_back(*record);
        }
        out["records"] = listed;
    }
    PrintJson(out);
    return 0;
}

int CrawlscopeApp::Headers(const CommandLine& cmd) {
    if (cmd.positional.empty()) {
        PrintUsage();
        return 2;
    }
    std::optional<std::string> requested;
    auto it = cmd.options.find("snapshot");
    if (it != cmd.options.end()) requested = it->second;
    const std::string snapshot = m_services.indexClient->resolveSnapshot(requested);

    auto report = m_services.aggregationEngine->headerAnalysis(cmd.positional[0], snapshot, IntOption(cmd, "sample", 100));
    PrintJson(report);
    return 0;
}

int CrawlscopeApp::CacheStats() {
    auto stats = m_services.cache->stats();
    PrintJson({
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"hitRatePercent", stats.hitRatePercent},
        {"evictions", stats.evictions},
        {"entryCount", stats.entryCount},
        {"sizeBytes", stats.sizeBytes},
        {"maxSizeBytes", stats.maxSizeBytes},
        {"memoryEntries", stats.memoryEntries},
        {"directory", m_services.cache->directory().string()}
    });
    return 0;
}

int CrawlscopeApp::CacheClear() {
    m_services.cache->clear();
    std::cerr << "[CrawlscopeApp] Cache cleared" << std::endl;
    return 0;
}

} // namespace crawlscope::app
