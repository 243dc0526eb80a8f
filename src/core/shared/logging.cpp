#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(svCore, "sieve.core")
Q_LOGGING_CATEGORY(svExtraction, "sieve.extraction")
Q_LOGGING_CATEGORY(svIngest, "sieve.ingest")
Q_LOGGING_CATEGORY(svIndex, "sieve.index")
Q_LOGGING_CATEGORY(svEmbedding, "sieve.embedding")
Q_LOGGING_CATEGORY(svVector, "sieve.vector")
Q_LOGGING_CATEGORY(svRetrieval, "sieve.retrieval")
Q_LOGGING_CATEGORY(svExplainer, "sieve.explainer")
