#include "infrastructure/CacheManager.hpp"
#include "infrastructure/HashUtils.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <algorithm>

namespace fs = std::filesystem;

namespace crawlscope::infrastructure {

namespace {

double NowSeconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::optional<std::string> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

} // namespace

CacheManager::CacheManager(const CacheOptions& options, std::shared_ptr<RemoteCacheTier> remote)
    : m_options(options),
      m_directory(options.directory),
      m_memory(options.memoryBytes),
      m_remote(std::move(remote)) {
    if (m_options.directory.empty()) {
        throw std::runtime_error("Cache directory is not configured");
    }
    if (m_options.maxSizeBytes == 0) {
        throw std::runtime_error("Cache maximum size must be positive");
    }
    if (m_options.defaultTtlSeconds <= 0) {
        throw std::runtime_error("Cache default TTL must be positive");
    }

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec || !fs::is_directory(m_directory)) {
        throw std::runtime_error("Cannot create cache directory " + m_directory.string() +
                                 (ec ? ": " + ec.message() : ""));
    }

    m_store = std::make_unique<CacheMetadataStore>(m_directory / "cache_metadata.db");
}

std::string CacheManager::HashKey(const std::string& key) {
    return HashUtils::Sha256Hex(key);
}

std::string CacheManager::BlobRelativePath(const std::string& keyHash) {
    return keyHash.substr(0, 2) + "/" + keyHash.substr(2, 2) + "/" + keyHash + ".cache";
}

std::optional<std::string> CacheManager::get(const std::string& key) {
    const std::string keyHash = HashKey(key);

    if (auto hot = m_memory.get(keyHash)) {
        ++m_hits;
        return hot;
    }

    if (m_remote) {
        try {
            if (auto shared = m_remote->get(keyHash)) {
                m_memory.put(keyHash, *shared, m_options.remoteTtlSeconds);
                ++m_hits;
                return shared;
            }
        } catch (const std::exception& e) {
            std::cerr << "[CacheManager] Remote tier read failed: " << e.what() << std::endl;
        }
    }

    int remainingTtl = 0;
    if (auto stored = readPersistent(keyHash, remainingTtl)) {
        m_memory.put(keyHash, *stored, remainingTtl);
        remoteSet(keyHash, *stored, remainingTtl);
        ++m_hits;
        return stored;
    }

    ++m_misses;
    return std::nullopt;
}

void CacheManager::set(const std::string& key, const std::string& value, std::optional<int> ttlSeconds) {
    const std::string keyHash = HashKey(key);
    const int ttl = ttlSeconds.value_or(m_options.defaultTtlSeconds);

    m_memory.put(keyHash, value, ttl);
    remoteSet(keyHash, value, ttl);
    writePersistent(keyHash, value, ttl);
    evictIfNeeded();
}

void CacheManager::clear() {
    m_memory.clear();

    if (m_remote) {
        try {
            m_remote->clear();
        } catch (const std::exception& e) {
            std::cerr << "[CacheManager] Remote tier clear failed: " << e.what() << std::endl;
        }
    }

    try {
        m_store->removeAll();
    } catch (const std::exception& e) {
        std::cerr << "[CacheManager] Metadata clear failed: " << e.what() << std::endl;
    }

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_directory, ec)) {
        std::error_code removeEc;
        if (entry.is_directory(removeEc)) {
            fs::remove_all(entry.path(), removeEc);
            if (removeEc) {
                std::cerr << "[CacheManager] Failed to remove " << entry.path() << ": " << removeEc.message() << std::endl;
            }
        }
    }
    if (ec) {
        std::cerr << "[CacheManager] Failed to list cache directory: " << ec.message() << std::endl;
    }
}

CacheStats CacheManager::stats() const {
    CacheStats s;
    s.hits = m_hits.load();
    s.misses = m_misses.load();
    const uint64_t total = s.hits + s.misses;
    if (total > 0) {
        s.hitRatePercent = std::round(10000.0 * static_cast<double>(s.hits) / static_cast<double>(total)) / 100.0;
    }
    s.evictions = m_evictions.load();
    s.maxSizeBytes = m_options.maxSizeBytes;
    s.memoryEntries = m_memory.entryCount();
    try {
        s.entryCount = m_store->entryCount();
        s.sizeBytes = m_store->totalSize();
    } catch (const std::exception& e) {
        std::cerr << "[CacheManager] Stats query failed: " << e.what() << std::endl;
    }
    return s;
}

std::optional<std::string> CacheManager::readPersistent(const std::string& keyHash, int& remainingTtl) {
    try {
        auto meta = m_store->find(keyHash);
        if (!meta) {
            // A blob without a row is unreachable; drop it
            removeBlob(BlobRelativePath(keyHash));
            return std::nullopt;
        }

        const double now = NowSeconds();
        if (meta->isExpired(now)) {
            removeBlob(meta->filename);
            m_store->remove(keyHash);
            return std::nullopt;
        }

        auto value = ReadFile(m_directory / meta->filename);
        if (!value) {
            m_store->remove(keyHash);
            return std::nullopt;
        }

        m_store->touch(keyHash, now);
        remainingTtl = std::max(1, static_cast<int>(meta->ttlSeconds - (now - meta->createdAt)));
        return value;
    } catch (const std::exception& e) {
        std::cerr << "[CacheManager] Persistent read failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

void CacheManager::writePersistent(const std::string& keyHash, const std::string& value, int ttlSeconds) {
    const std::string relative = BlobRelativePath(keyHash);
    const fs::path finalPath = m_directory / relative;

    // Write to a unique temp file, then rename over the blob
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(stamp) + ".tmp";

    try {
        fs::create_directories(finalPath.parent_path());
        {
            std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                std::cerr << "[CacheManager] Failed to open temp blob: " << tempPath << std::endl;
                return;
            }
            out.write(value.data(), static_cast<std::streamsize>(value.size()));
            if (out.fail()) {
                std::cerr << "[CacheManager] Write failed: " << tempPath << std::endl;
                out.close();
                std::error_code ec;
                fs::remove(tempPath, ec);
                return;
            }
        }
        fs::rename(tempPath, finalPath);

        const double now = NowSeconds();
        CacheEntryMeta meta;
        meta.keyHash = keyHash;
        meta.filename = relative;
        meta.sizeBytes = value.size();
        meta.createdAt = now;
        meta.lastAccessed = now;
        meta.accessCount = 0;
        meta.ttlSeconds = ttlSeconds;
        m_store->upsert(meta);
    } catch (const std::exception& e) {
        std::cerr << "[CacheManager] Persistent write failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
    }
}

void CacheManager::evictIfNeeded() {
    // A concurrent writer already running eviction covers this one
    std::unique_lock<std::mutex> lock(m_evictionMutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }

    try {
        if (m_store->totalSize() <= m_options.maxSizeBytes) {
            return;
        }
        const uint64_t count = m_store->entryCount();
        const uint64_t toEvict = std::max<uint64_t>(1, count / 10);

        for (const auto& victim : m_store->leastRecentlyAccessed(toEvict)) {
            removeBlob(victim.filename);
            m_store->remove(victim.keyHash);
            m_memory.erase(victim.keyHash);
            ++m_evictions;
        }
    } catch (const std::exception& e) {
        std::cerr << "[CacheManager] Eviction failed: " << e.what() << std::endl;
    }
}

void CacheManager::removeBlob(const std::string& relativePath) const {
    std::error_code ec;
    fs::remove(m_directory / relativePath, ec);
    if (ec) {
        std::cerr << "[CacheManager] Failed to remove blob " << relativePath << ": " << ec.message() << std::endl;
    }
}

void CacheManager::remoteSet(const std::string& keyHash, const std::string& value, int ttlSeconds) {
    if (!m_remote) {
        return;
    }
    try {
        m_remote->set(keyHash, value, std::min(ttlSeconds, m_options.remoteTtlSeconds));
    } catch (const std::exception& e) {
        std::cerr << "[CacheManager] Remote tier write failed: " << e.what() << std::endl;
    }
}

} // namespace crawlscope::infrastructure
