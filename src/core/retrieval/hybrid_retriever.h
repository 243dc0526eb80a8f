#pragma once

#include "core/index/bm25_index.h"
#include "core/query/query_embedding_cache.h"
#include "core/shared/retrieval_candidate.h"
#include "core/shared/types.h"
#include "core/vector/search_merger.h"

#include <QJsonObject>
#include <QString>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace sv {

class EmbeddingAdapter;
class ManifestStore;
class VectorIndexClient;

struct RetrieverConfig {
    double semanticWeight = 0.6;
    double bm25Weight = 0.4;
    bool enableLexical = true;
    int snippetChars = 300;
    int slowSearchWarnMs = 170;
    Bm25Config bm25;
};

struct RetrieverMetrics {
    int64_t queryCount = 0;
    int64_t failedQueries = 0;
    int64_t slowQueries = 0;
    int64_t cacheHits = 0;
    int64_t cacheMisses = 0;
    int64_t lexicalRebuilds = 0;
    double averageLatencyMs = 0.0;

    QJsonObject toJson() const;
};

// HybridRetriever: answers a query with a ranked, governance-aware list of
// chunks by merging vector similarity with BM25.
//
// search() never throws: any failure is logged and yields an empty list.
// The BM25 index covers one scope at a time and is rebuilt from the
// manifest when a query asks for a different scope.
class HybridRetriever {
public:
    using Config = RetrieverConfig;

    HybridRetriever(EmbeddingAdapter& embedder,
                    VectorIndexClient& vectorIndex,
                    ManifestStore& manifest,
                    const Config& config = {},
                    const QueryEmbeddingCacheConfig& cacheConfig = {});

    HybridRetriever(const HybridRetriever&) = delete;
    HybridRetriever& operator=(const HybridRetriever&) = delete;

    std::vector<RetrievalCandidate> search(const QString& query,
                                           const QString& scope,
                                           int topK = 10,
                                           GovernanceMode mode = GovernanceMode::Permission,
                                           const QJsonObject& filters = {});

    // Forces the next lexical search to rebuild from the manifest.
    void invalidateLexicalIndex();
    void clearQueryCache();

    // Incremental lexical maintenance; ignored unless the index currently
    // covers the chunk's scope.
    void indexChunkText(const QString& chunkId, const QString& text, const QString& scope);
    void removeChunkText(const QString& chunkId);

    std::optional<QString> lexicalScope() const;
    RetrieverMetrics metrics() const;
    const Config& config() const { return m_config; }

private:
    std::vector<RetrievalCandidate> searchImpl(const QString& query,
                                               const QString& scope,
                                               int topK,
                                               GovernanceMode mode,
                                               const QJsonObject& filters);

    std::vector<float> resolveQueryEmbedding(const QString& query);
    std::vector<ScoredId> lexicalSearch(const QString& query, const QString& scope, int limit);
    std::optional<RetrievalCandidate> hydrateFromManifest(const QString& chunkId,
                                                          const QJsonObject& filters) const;
    RetrievalCandidate candidateFromPayload(const QString& chunkId,
                                            const QJsonObject& payload) const;
    QString makeSnippet(const QString& text) const;
    void recordLatency(double elapsedMs);

    EmbeddingAdapter& m_embedder;
    VectorIndexClient& m_vectorIndex;
    ManifestStore& m_manifest;
    Config m_config;
    QueryEmbeddingCache m_queryCache;

    mutable std::mutex m_lexicalMutex;
    Bm25Index m_bm25;
    std::optional<QString> m_lexicalScope;

    mutable std::mutex m_metricsMutex;
    RetrieverMetrics m_metrics;
    double m_totalLatencyMs = 0.0;
};

} // namespace sv
