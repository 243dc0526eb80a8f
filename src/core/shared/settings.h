#pragma once

#include "core/embedding/embedding_adapter.h"
#include "core/embedding/rate_limiter.h"
#include "core/explain/retrieval_explainer.h"
#include "core/index/bm25_index.h"
#include "core/indexing/chunker.h"
#include "core/query/query_embedding_cache.h"
#include "core/retrieval/hybrid_retriever.h"
#include "core/vector/hnsw_vector_index.h"

#include <QString>

namespace sv {

struct Settings {
    // Manifest database; ":memory:" for a throwaway store
    QString manifestPath;

    ChunkerConfig chunker;
    EmbeddingConfig embedding;
    RateLimiterConfig rateLimiter;
    VectorIndexConfig vectorIndex;
    RetrieverConfig retriever; // carries the Bm25Config
    QueryEmbeddingCacheConfig queryCache;
    ExplainerConfig explainer;
};

} // namespace sv
