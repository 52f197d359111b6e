#include "infrastructure/MemoryCache.hpp"
#include <iterator>

namespace crawlscope::infrastructure {

MemoryCache::MemoryCache(uint64_t maxBytes) : m_maxBytes(maxBytes) {}

std::optional<std::string> MemoryCache::get(const std::string& keyHash) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto found = m_index.find(keyHash);
    if (found == m_index.end()) {
        return std::nullopt;
    }
    auto it = found->second;
    if (std::chrono::steady_clock::now() >= it->expiresAt) {
        eraseLocked(it);
        return std::nullopt;
    }
    m_entries.splice(m_entries.begin(), m_entries, it);
    return it->value;
}

void MemoryCache::put(const std::string& keyHash, const std::string& value, int ttlSeconds) {
    if (m_maxBytes == 0 || value.size() > m_maxBytes) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto found = m_index.find(keyHash);
    if (found != m_index.end()) {
        eraseLocked(found->second);
    }

    Entry entry{keyHash, value, std::chrono::steady_clock::now() + std::chrono::seconds(ttlSeconds)};
    m_entries.push_front(std::move(entry));
    m_index[keyHash] = m_entries.begin();
    m_sizeBytes += value.size();

    while (m_sizeBytes > m_maxBytes && !m_entries.empty()) {
        eraseLocked(std::prev(m_entries.end()));
    }
}

void MemoryCache::erase(const std::string& keyHash) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto found = m_index.find(keyHash);
    if (found != m_index.end()) {
        eraseLocked(found->second);
    }
}

void MemoryCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_index.clear();
    m_sizeBytes = 0;
}

size_t MemoryCache::entryCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

uint64_t MemoryCache::sizeBytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sizeBytes;
}

void MemoryCache::eraseLocked(EntryList::iterator it) {
    m_sizeBytes -= it->value.size();
    m_index.erase(it->keyHash);
    m_entries.erase(it);
}

} // namespace crawlscope::infrastructure
