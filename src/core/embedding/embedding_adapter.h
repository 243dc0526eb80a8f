#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/embedding/rate_limiter.h"

#include <QJsonObject>
#include <QString>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace sv {

struct EmbeddingConfig {
    int batchSize = 100;
    int maxRetries = 3;
    int retryBaseDelayMs = 1000;     // rate-limit backoff base
    int transientBaseDelayMs = 5000; // backoff base for other retryable errors
};

struct EmbeddingUsage {
    int64_t callCount = 0;  // successful provider calls
    int64_t tokenCount = 0; // whitespace word count of submitted texts
    int64_t errorCount = 0; // failed attempts, retried ones included

    QJsonObject toJson() const;
};

// EmbeddingAdapter: batches texts through an EmbeddingProvider under a
// shared RateLimiter with bounded retries.
//
// Failure policy per attempt (attempts = 1 + maxRetries):
//   rate limited / quota   -> sleep retryBaseDelayMs * 2^attempt, retry
//   malformed request      -> throw EmbeddingError at once
//   anything else          -> sleep transientBaseDelayMs * 2^attempt, retry
// When the attempts run out the last error is thrown.
//
// Backoff sleeps wake early on requestCancel(), which makes the pending call
// throw a non-retryable EmbeddingError.
class EmbeddingAdapter {
public:
    using Config = EmbeddingConfig;

    enum class FailureKind {
        RateLimited,
        Fatal,
        Transient,
    };

    EmbeddingAdapter(EmbeddingProvider& provider, RateLimiter& rateLimiter,
                     const Config& config = {});

    EmbeddingAdapter(const EmbeddingAdapter&) = delete;
    EmbeddingAdapter& operator=(const EmbeddingAdapter&) = delete;

    // Document-mode vectors, one per text, in input order.
    std::vector<std::vector<float>> embedChunks(const std::vector<QString>& texts);

    // Query-mode vector for a search query.
    std::vector<float> embedQuery(const QString& text);

    QString model() const { return m_provider.model(); }
    QString modelVersion() const { return m_provider.modelVersion(); }
    int dimensions() const { return m_provider.dimensions(); }

    EmbeddingUsage usage() const;
    void resetUsage();

    void requestCancel();
    void clearCancel();
    bool isCancelRequested() const { return m_cancelRequested.load(); }

    static FailureKind classify(const ProviderStatus& status);
    std::chrono::milliseconds backoffDelay(FailureKind kind, int attempt) const;

private:
    EmbeddingResponse callWithRetry(const std::function<EmbeddingResponse()>& call,
                                    size_t expectedVectors,
                                    int64_t wordCount,
                                    const char* operation);

    // Returns false if cancelled while waiting.
    bool sleepFor(std::chrono::milliseconds delay);

    EmbeddingProvider& m_provider;
    RateLimiter& m_rateLimiter;
    Config m_config;

    std::atomic<int64_t> m_callCount{0};
    std::atomic<int64_t> m_tokenCount{0};
    std::atomic<int64_t> m_errorCount{0};

    std::atomic<bool> m_cancelRequested{false};
    std::mutex m_sleepMutex;
    std::condition_variable m_sleepCv;
};

} // namespace sv
