#include "core/query/query_embedding_cache.h"

#include <algorithm>

namespace sv {

QueryEmbeddingCache::QueryEmbeddingCache(QueryEmbeddingCacheConfig config)
    : m_config(config)
{
    m_config.maxEntries = std::max(1, m_config.maxEntries);
    m_config.ttlMs = std::max(0, m_config.ttlMs);
}

bool QueryEmbeddingCache::isExpired(const Entry& entry,
                                    std::chrono::steady_clock::time_point now) const
{
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - entry.insertedAt);
    return age.count() >= m_config.ttlMs;
}

std::optional<std::vector<float>> QueryEmbeddingCache::get(const QString& query)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(query);
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    if (isExpired(*it->second, std::chrono::steady_clock::now())) {
        m_list.erase(it->second);
        m_index.erase(it);
        ++m_misses;
        return std::nullopt;
    }

    ++m_hits;
    return it->second->vector;
}

void QueryEmbeddingCache::put(const QString& query, std::vector<float> vector)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto existing = m_index.find(query);
    if (existing != m_index.end()) {
        m_list.erase(existing->second);
        m_index.erase(existing);
    }

    if (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        m_index.erase(m_list.back().key);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({query, std::move(vector), std::chrono::steady_clock::now()});
    m_index[query] = m_list.begin();
}

void QueryEmbeddingCache::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
}

QueryEmbeddingCache::Stats QueryEmbeddingCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, static_cast<int>(m_list.size())};
}

} // namespace sv
