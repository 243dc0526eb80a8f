#include "core/retrieval/hybrid_retriever.h"

#include "core/embedding/embedding_adapter.h"
#include "core/index/manifest_store.h"
#include "core/ranking/governance.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index_client.h"

#include <QElapsedTimer>

#include <algorithm>
#include <exception>
#include <unordered_map>

namespace sv {

namespace {

const QStringList kKnownPayloadKeys = {
    QStringLiteral("doc_id"),
    QStringLiteral("chunk_id"),
    QStringLiteral("path"),
    QStringLiteral("scope"),
    QStringLiteral("text"),
    QStringLiteral("risk_level"),
};

QJsonObject extraMetadata(const QJsonObject& payload)
{
    QJsonObject metadata;
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (!kKnownPayloadKeys.contains(it.key())) {
            metadata.insert(it.key(), it.value());
        }
    }
    return metadata;
}

} // namespace

QJsonObject RetrieverMetrics::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("query_count")] = static_cast<double>(queryCount);
    json[QStringLiteral("failed_queries")] = static_cast<double>(failedQueries);
    json[QStringLiteral("slow_queries")] = static_cast<double>(slowQueries);
    json[QStringLiteral("cache_hits")] = static_cast<double>(cacheHits);
    json[QStringLiteral("cache_misses")] = static_cast<double>(cacheMisses);
    json[QStringLiteral("lexical_rebuilds")] = static_cast<double>(lexicalRebuilds);
    json[QStringLiteral("average_latency_ms")] = averageLatencyMs;
    return json;
}

HybridRetriever::HybridRetriever(EmbeddingAdapter& embedder,
                                 VectorIndexClient& vectorIndex,
                                 ManifestStore& manifest,
                                 const Config& config,
                                 const QueryEmbeddingCacheConfig& cacheConfig)
    : m_embedder(embedder)
    , m_vectorIndex(vectorIndex)
    , m_manifest(manifest)
    , m_config(config)
    , m_queryCache(cacheConfig)
    , m_bm25(config.bm25)
{
    m_config.snippetChars = std::max(0, m_config.snippetChars);
    if (!SearchMerger::weightsSumToOne({m_config.semanticWeight, m_config.bm25Weight})) {
        LOG_WARN(svRetrieval, "Retriever weights do not sum to 1 (semantic=%.3f, bm25=%.3f)",
                 m_config.semanticWeight, m_config.bm25Weight);
    }
}

std::vector<RetrievalCandidate> HybridRetriever::search(const QString& query,
                                                        const QString& scope,
                                                        int topK,
                                                        GovernanceMode mode,
                                                        const QJsonObject& filters)
{
    if (query.trimmed().isEmpty() || scope.trimmed().isEmpty() || topK <= 0) {
        return {};
    }

    QElapsedTimer timer;
    timer.start();

    std::vector<RetrievalCandidate> results;
    bool failed = false;
    try {
        results = searchImpl(query, scope, topK, mode, filters);
    } catch (const std::exception& e) {
        LOG_ERROR(svRetrieval, "Search failed for scope '%s': %s",
                  qPrintable(scope), e.what());
        failed = true;
    }

    const double elapsedMs = static_cast<double>(timer.nsecsElapsed()) / 1e6;
    recordLatency(elapsedMs);
    {
        std::lock_guard<std::mutex> lock(m_metricsMutex);
        if (failed) {
            ++m_metrics.failedQueries;
        }
        if (elapsedMs > m_config.slowSearchWarnMs) {
            ++m_metrics.slowQueries;
        }
    }
    if (elapsedMs > m_config.slowSearchWarnMs) {
        LOG_WARN(svRetrieval, "Slow search: %.1fms (threshold %dms) scope=%s topK=%d",
                 elapsedMs, m_config.slowSearchWarnMs, qPrintable(scope), topK);
    }

    LOG_DEBUG(svRetrieval, "Search scope=%s mode=%s -> %d results in %.1fms",
              qPrintable(scope), qPrintable(governanceModeToString(mode)),
              static_cast<int>(results.size()), elapsedMs);
    return results;
}

std::vector<RetrievalCandidate> HybridRetriever::searchImpl(const QString& query,
                                                            const QString& scope,
                                                            int topK,
                                                            GovernanceMode mode,
                                                            const QJsonObject& filters)
{
    const int fetchLimit = topK * 2;

    const std::vector<float> queryVector = resolveQueryEmbedding(query);
    const std::vector<VectorHit> vectorHits =
        m_vectorIndex.search(queryVector, scope, fetchLimit, filters);

    std::vector<ScoredId> semantic;
    semantic.reserve(vectorHits.size());
    std::unordered_map<QString, const VectorHit*, QStringHash> hitById;
    for (const VectorHit& hit : vectorHits) {
        semantic.push_back({hit.id, hit.score});
        hitById.emplace(hit.id, &hit);
    }

    std::vector<ScoredId> lexical;
    if (m_config.enableLexical) {
        lexical = lexicalSearch(query, scope, fetchLimit);
    }

    const std::vector<MergedHit> merged = SearchMerger::merge(
        semantic, lexical, {m_config.semanticWeight, m_config.bm25Weight});

    std::vector<RetrievalCandidate> candidates;
    candidates.reserve(merged.size());
    for (const MergedHit& hit : merged) {
        std::optional<RetrievalCandidate> candidate;
        const auto vectorIt = hitById.find(hit.chunkId);
        if (vectorIt != hitById.end()) {
            candidate = candidateFromPayload(hit.chunkId, vectorIt->second->payload);
        } else {
            candidate = hydrateFromManifest(hit.chunkId, filters);
        }
        if (!candidate) {
            continue;
        }
        if (candidate->scope.isEmpty()) {
            candidate->scope = scope;
        } else if (candidate->scope != scope) {
            continue;
        }

        candidate->semanticScore = hit.semanticRaw.value_or(0.0);
        candidate->bm25Score = hit.bm25Norm;
        candidate->score = hit.combinedScore * Governance::multiplier(mode, candidate->riskLevel);
        candidate->allowedInMode = Governance::allowedStatus(mode, candidate->riskLevel);
        candidates.push_back(std::move(*candidate));
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const RetrievalCandidate& lhs, const RetrievalCandidate& rhs) {
                         if (lhs.score != rhs.score) {
                             return lhs.score > rhs.score;
                         }
                         return lhs.chunkId < rhs.chunkId;
                     });
    if (candidates.size() > static_cast<size_t>(topK)) {
        candidates.resize(static_cast<size_t>(topK));
    }
    for (size_t i = 0; i < candidates.size(); ++i) {
        candidates[i].rank = static_cast<int>(i) + 1;
    }
    return candidates;
}

std::vector<float> HybridRetriever::resolveQueryEmbedding(const QString& query)
{
    if (auto cached = m_queryCache.get(query)) {
        std::lock_guard<std::mutex> lock(m_metricsMutex);
        ++m_metrics.cacheHits;
        return std::move(*cached);
    }

    {
        std::lock_guard<std::mutex> lock(m_metricsMutex);
        ++m_metrics.cacheMisses;
    }
    std::vector<float> vector = m_embedder.embedQuery(query);
    m_queryCache.put(query, vector);
    return vector;
}

std::vector<ScoredId> HybridRetriever::lexicalSearch(const QString& query,
                                                     const QString& scope,
                                                     int limit)
{
    std::lock_guard<std::mutex> lock(m_lexicalMutex);

    if (!m_lexicalScope || *m_lexicalScope != scope || !m_bm25.isBuilt()) {
        const std::vector<ChunkText> texts = m_manifest.listChunkTexts(scope);
        std::vector<Bm25Document> documents;
        documents.reserve(texts.size());
        for (const ChunkText& text : texts) {
            documents.push_back({text.chunkId, text.text});
        }
        m_bm25.build(documents);
        m_lexicalScope = scope;
        {
            std::lock_guard<std::mutex> metricsLock(m_metricsMutex);
            ++m_metrics.lexicalRebuilds;
        }
        LOG_INFO(svRetrieval, "BM25 index rebuilt for scope '%s' with %d chunks",
                 qPrintable(scope), static_cast<int>(documents.size()));
    }

    std::vector<ScoredId> lexical;
    for (const Bm25Hit& hit : m_bm25.search(query, limit)) {
        lexical.push_back({hit.chunkId, hit.score});
    }
    return lexical;
}

std::optional<RetrievalCandidate> HybridRetriever::hydrateFromManifest(
    const QString& chunkId, const QJsonObject& filters) const
{
    const std::optional<ChunkText> chunk = m_manifest.getChunkText(chunkId);
    if (!chunk) {
        LOG_DEBUG(svRetrieval, "Lexical hit %s no longer in manifest", qPrintable(chunkId));
        return std::nullopt;
    }

    QJsonObject payload = chunk->metadata;
    payload[QStringLiteral("doc_id")] = chunk->docId;
    payload[QStringLiteral("chunk_id")] = chunk->chunkId;
    payload[QStringLiteral("path")] = chunk->path;
    payload[QStringLiteral("scope")] = chunk->scope;
    payload[QStringLiteral("chunk_index")] = chunk->chunkIndex;
    payload[QStringLiteral("risk_level")] = riskLevelToString(chunk->riskLevel);
    if (!payloadMatches(payload, QString(), filters)) {
        return std::nullopt;
    }

    payload[QStringLiteral("text")] = chunk->text;
    return candidateFromPayload(chunkId, payload);
}

RetrievalCandidate HybridRetriever::candidateFromPayload(const QString& chunkId,
                                                         const QJsonObject& payload) const
{
    RetrievalCandidate candidate;
    candidate.chunkId = chunkId;
    candidate.docId = payload.value(QStringLiteral("doc_id")).toString();
    candidate.path = payload.value(QStringLiteral("path")).toString();
    candidate.scope = payload.value(QStringLiteral("scope")).toString();
    candidate.snippet = makeSnippet(payload.value(QStringLiteral("text")).toString());
    candidate.riskLevel = riskLevelFromString(payload.value(QStringLiteral("risk_level")).toString());
    candidate.metadata = extraMetadata(payload);
    return candidate;
}

QString HybridRetriever::makeSnippet(const QString& text) const
{
    return text.left(m_config.snippetChars);
}

void HybridRetriever::recordLatency(double elapsedMs)
{
    std::lock_guard<std::mutex> lock(m_metricsMutex);
    ++m_metrics.queryCount;
    m_totalLatencyMs += elapsedMs;
    m_metrics.averageLatencyMs = m_totalLatencyMs / static_cast<double>(m_metrics.queryCount);
}

void HybridRetriever::invalidateLexicalIndex()
{
    std::lock_guard<std::mutex> lock(m_lexicalMutex);
    m_bm25.clear();
    m_lexicalScope.reset();
}

void HybridRetriever::clearQueryCache()
{
    m_queryCache.clear();
}

void HybridRetriever::indexChunkText(const QString& chunkId, const QString& text,
                                     const QString& scope)
{
    std::lock_guard<std::mutex> lock(m_lexicalMutex);
    if (!m_lexicalScope || *m_lexicalScope != scope) {
        return;
    }
    m_bm25.update(chunkId, text);
}

void HybridRetriever::removeChunkText(const QString& chunkId)
{
    std::lock_guard<std::mutex> lock(m_lexicalMutex);
    if (!m_lexicalScope) {
        return;
    }
    m_bm25.remove(chunkId);
}

std::optional<QString> HybridRetriever::lexicalScope() const
{
    std::lock_guard<std::mutex> lock(m_lexicalMutex);
    return m_lexicalScope;
}

RetrieverMetrics HybridRetriever::metrics() const
{
    std::lock_guard<std::mutex> lock(m_metricsMutex);
    return m_metrics;
}

} // namespace sv
