#include "core/embedding/embedding_adapter.h"
#include "core/shared/errors.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>

namespace sv {

namespace {

int64_t wordCount(const QString& text)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    return text.split(whitespace, Qt::SkipEmptyParts).size();
}

QString describe(const ProviderStatus& status)
{
    if (status.httpStatus > 0) {
        return QStringLiteral("HTTP %1: %2").arg(status.httpStatus).arg(status.message);
    }
    return status.message.isEmpty() ? QStringLiteral("unknown provider error") : status.message;
}

} // anonymous namespace

QJsonObject EmbeddingUsage::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("call_count")] = static_cast<qint64>(callCount);
    json[QStringLiteral("token_count")] = static_cast<qint64>(tokenCount);
    json[QStringLiteral("error_count")] = static_cast<qint64>(errorCount);
    return json;
}

EmbeddingAdapter::EmbeddingAdapter(EmbeddingProvider& provider, RateLimiter& rateLimiter,
                                   const Config& config)
    : m_provider(provider)
    , m_rateLimiter(rateLimiter)
    , m_config(config)
{
    m_config.batchSize = std::max(1, m_config.batchSize);
    m_config.maxRetries = std::max(0, m_config.maxRetries);
}

// ── Classification ──────────────────────────────────────────

EmbeddingAdapter::FailureKind EmbeddingAdapter::classify(const ProviderStatus& status)
{
    switch (status.code) {
    case ProviderStatus::Code::RateLimited:
    case ProviderStatus::Code::QuotaExceeded:
        return FailureKind::RateLimited;
    case ProviderStatus::Code::InvalidRequest:
        return FailureKind::Fatal;
    case ProviderStatus::Code::Unavailable:
    case ProviderStatus::Code::Timeout:
    case ProviderStatus::Code::Ok:
        break;
    case ProviderStatus::Code::Unknown:
        if (status.httpStatus == 429) {
            return FailureKind::RateLimited;
        }
        if (status.httpStatus == 400) {
            return FailureKind::Fatal;
        }
        // Providers that only give us text: fall back to its wording.
        {
            const QString message = status.message.toLower();
            if (message.contains(QLatin1String("429"))
                || message.contains(QLatin1String("rate limit"))
                || message.contains(QLatin1String("rate_limit"))
                || message.contains(QLatin1String("quota"))) {
                return FailureKind::RateLimited;
            }
            if (message.contains(QLatin1String("400"))
                || message.contains(QLatin1String("invalid"))) {
                return FailureKind::Fatal;
            }
        }
        break;
    }

    if (status.httpStatus == 429) {
        return FailureKind::RateLimited;
    }
    if (status.httpStatus == 400) {
        return FailureKind::Fatal;
    }
    return FailureKind::Transient;
}

std::chrono::milliseconds EmbeddingAdapter::backoffDelay(FailureKind kind, int attempt) const
{
    const int64_t base = (kind == FailureKind::RateLimited) ? m_config.retryBaseDelayMs
                                                            : m_config.transientBaseDelayMs;
    return std::chrono::milliseconds(base * (int64_t{1} << std::min(attempt, 20)));
}

// ── Public API ──────────────────────────────────────────────

std::vector<std::vector<float>> EmbeddingAdapter::embedChunks(const std::vector<QString>& texts)
{
    std::vector<std::vector<float>> vectors;
    vectors.reserve(texts.size());

    const size_t batchSize = static_cast<size_t>(m_config.batchSize);
    for (size_t begin = 0; begin < texts.size(); begin += batchSize) {
        const size_t end = std::min(begin + batchSize, texts.size());
        const std::vector<QString> batch(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));

        int64_t words = 0;
        for (const QString& text : batch) {
            words += wordCount(text);
        }

        EmbeddingResponse response = callWithRetry(
            [this, &batch]() { return m_provider.embedBatch(batch); },
            batch.size(), words, "embed_batch");

        for (EmbeddingVector& embedding : response.embeddings) {
            vectors.push_back(std::move(embedding.vector));
        }
        LOG_DEBUG(svEmbedding, "Embedded batch %lld-%lld of %lld",
                  static_cast<long long>(begin), static_cast<long long>(end),
                  static_cast<long long>(texts.size()));
    }

    return vectors;
}

std::vector<float> EmbeddingAdapter::embedQuery(const QString& text)
{
    EmbeddingResponse response = callWithRetry(
        [this, &text]() { return m_provider.embedQuery(text); },
        1, wordCount(text), "embed_query");
    return std::move(response.embeddings.front().vector);
}

EmbeddingUsage EmbeddingAdapter::usage() const
{
    EmbeddingUsage u;
    u.callCount = m_callCount.load();
    u.tokenCount = m_tokenCount.load();
    u.errorCount = m_errorCount.load();
    return u;
}

void EmbeddingAdapter::resetUsage()
{
    m_callCount.store(0);
    m_tokenCount.store(0);
    m_errorCount.store(0);
}

void EmbeddingAdapter::requestCancel()
{
    {
        std::lock_guard<std::mutex> lock(m_sleepMutex);
        m_cancelRequested.store(true);
    }
    m_sleepCv.notify_all();
}

void EmbeddingAdapter::clearCancel()
{
    m_cancelRequested.store(false);
}

// ── Retry loop ──────────────────────────────────────────────

EmbeddingResponse EmbeddingAdapter::callWithRetry(const std::function<EmbeddingResponse()>& call,
                                                  size_t expectedVectors,
                                                  int64_t wordCount,
                                                  const char* operation)
{
    const int attempts = m_config.maxRetries + 1;
    ProviderStatus lastStatus;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (m_cancelRequested.load()) {
            throw EmbeddingError(QStringLiteral("%1 cancelled").arg(QLatin1String(operation)),
                                 false);
        }

        m_rateLimiter.acquire();
        EmbeddingResponse response = call();

        if (response.status.ok()) {
            if (response.embeddings.size() != expectedVectors) {
                m_errorCount.fetch_add(1);
                throw EmbeddingError(
                    QStringLiteral("%1: provider returned %2 vectors for %3 inputs")
                        .arg(QLatin1String(operation))
                        .arg(response.embeddings.size())
                        .arg(expectedVectors),
                    false);
            }
            m_callCount.fetch_add(1);
            m_tokenCount.fetch_add(wordCount);
            return response;
        }

        m_errorCount.fetch_add(1);
        lastStatus = response.status;
        const FailureKind kind = classify(response.status);

        if (kind == FailureKind::Fatal) {
            LOG_ERROR(svEmbedding, "%s rejected by provider: %s", operation,
                      qUtf8Printable(describe(response.status)));
            throw EmbeddingError(describe(response.status), false, response.status.httpStatus);
        }

        if (attempt + 1 >= attempts) {
            break;
        }

        const std::chrono::milliseconds delay = backoffDelay(kind, attempt);
        LOG_WARN(svEmbedding, "%s attempt %d/%d failed (%s), retrying in %lld ms",
                 operation, attempt + 1, attempts,
                 qUtf8Printable(describe(response.status)),
                 static_cast<long long>(delay.count()));
        if (!sleepFor(delay)) {
            throw EmbeddingError(QStringLiteral("%1 cancelled during backoff")
                                     .arg(QLatin1String(operation)),
                                 false);
        }
    }

    LOG_ERROR(svEmbedding, "%s failed after %d attempts: %s", operation, attempts,
              qUtf8Printable(describe(lastStatus)));
    throw EmbeddingError(describe(lastStatus), true, lastStatus.httpStatus);
}

bool EmbeddingAdapter::sleepFor(std::chrono::milliseconds delay)
{
    std::unique_lock<std::mutex> lock(m_sleepMutex);
    return !m_sleepCv.wait_for(lock, delay, [this]() { return m_cancelRequested.load(); });
}

} // namespace sv
