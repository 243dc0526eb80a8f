#pragma once

#include <QString>

#include <vector>

namespace sv {

// Outcome of one provider call, classified at the adapter boundary.
struct ProviderStatus {
    enum class Code {
        Ok,
        RateLimited,
        QuotaExceeded,
        InvalidRequest,
        Unavailable,
        Timeout,
        Unknown,
    };

    Code code = Code::Ok;
    int httpStatus = 0;
    QString message;

    bool ok() const { return code == Code::Ok; }
};

struct EmbeddingVector {
    std::vector<float> vector;
    int tokenCount = 0;
    QString model;
    QString modelVersion;
};

struct EmbeddingResponse {
    ProviderStatus status;
    std::vector<EmbeddingVector> embeddings; // one per input, in input order
};

// EmbeddingProvider: external embedding service.
//
// embedQuery() uses the provider's query task mode, which may produce a
// different vector than embedBatch() for the same text.
// Implementations report failures through EmbeddingResponse::status and do
// not throw.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual QString model() const = 0;
    virtual QString modelVersion() const = 0;
    virtual int dimensions() const = 0;

    virtual EmbeddingResponse embedBatch(const std::vector<QString>& texts) = 0;
    virtual EmbeddingResponse embedQuery(const QString& text) = 0;
};

} // namespace sv
