#pragma once

#include "core/shared/types.h"

#include <QString>

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace sv {

struct QueryEmbeddingCacheConfig {
    int maxEntries = 100;
    int ttlMs = 60000;
};

// TTL cache of query embeddings keyed by query text.
//
// Entries expire ttlMs after insertion; hits do not refresh them. When full,
// the single oldest entry is evicted before inserting.
class QueryEmbeddingCache {
public:
    explicit QueryEmbeddingCache(QueryEmbeddingCacheConfig config = {});

    std::optional<std::vector<float>> get(const QString& query);
    void put(const QString& query, std::vector<float> vector);
    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int currentSize = 0;
    };
    Stats stats() const;

private:
    struct Entry {
        QString key;
        std::vector<float> vector;
        std::chrono::steady_clock::time_point insertedAt;
    };

    bool isExpired(const Entry& entry, std::chrono::steady_clock::time_point now) const;

    QueryEmbeddingCacheConfig m_config;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = newest insertion
    std::unordered_map<QString, std::list<Entry>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace sv
