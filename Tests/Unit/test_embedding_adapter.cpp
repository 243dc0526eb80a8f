#include <QtTest/QtTest>
#include "core/embedding/embedding_adapter.h"
#include "core/embedding/rate_limiter.h"
#include "core/shared/errors.h"
#include "Support/fake_providers.h"

#include <QElapsedTimer>

#include <thread>

using sv::EmbeddingAdapter;
using sv::ProviderStatus;
using sv::test::FakeEmbeddingProvider;

namespace {

sv::EmbeddingConfig fastConfig(int maxRetries = 3)
{
    sv::EmbeddingConfig config;
    config.batchSize = 100;
    config.maxRetries = maxRetries;
    config.retryBaseDelayMs = 1;
    config.transientBaseDelayMs = 1;
    return config;
}

std::vector<QString> numberedTexts(int n)
{
    std::vector<QString> texts;
    for (int i = 0; i < n; ++i) {
        texts.push_back(QStringLiteral("document number %1 about topic %2").arg(i).arg(i % 7));
    }
    return texts;
}

} // namespace

class TestEmbeddingAdapter : public QObject {
    Q_OBJECT

private slots:
    // ── Batching ─────────────────────────────────────────────────
    void testBatchesPreserveOrder();
    void testQueryModeDiffersFromDocumentMode();
    void testUsageCountsWords();

    // ── Retry policy ─────────────────────────────────────────────
    void testRateLimitRetriesThenSucceeds();
    void testInvalidRequestIsFatal();
    void testExhaustedRetriesThrowRetryable();
    void testVectorCountMismatchIsFatal();

    // ── Classification & backoff ─────────────────────────────────
    void testClassifyTypedCodes();
    void testClassifyUnknownFallsBackToMessage();
    void testBackoffIsExponential();

    // ── Cancellation ─────────────────────────────────────────────
    void testCancelBeforeCall();
    void testCancelWakesBackoff();
};

// ── Batching ─────────────────────────────────────────────────────

void TestEmbeddingAdapter::testBatchesPreserveOrder()
{
    FakeEmbeddingProvider provider;
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter, fastConfig());

    const auto texts = numberedTexts(250);
    const auto vectors = adapter.embedChunks(texts);

    QCOMPARE(static_cast<int>(vectors.size()), 250);
    QCOMPARE(provider.batchCalls(), 3);
    QVERIFY(vectors[0] == provider.vectorFor(texts[0]));
    QVERIFY(vectors[137] == provider.vectorFor(texts[137]));
    QVERIFY(vectors[249] == provider.vectorFor(texts[249]));
}

void TestEmbeddingAdapter::testQueryModeDiffersFromDocumentMode()
{
    FakeEmbeddingProvider provider;
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter, fastConfig());

    const QString text = QStringLiteral("how do I rotate credentials");
    const auto doc = adapter.embedChunks({text});
    const auto query = adapter.embedQuery(text);
    QCOMPARE(static_cast<int>(query.size()), adapter.dimensions());
    QVERIFY(doc[0] != query);
    QCOMPARE(provider.queryCalls(), 1);
}

void TestEmbeddingAdapter::testUsageCountsWords()
{
    FakeEmbeddingProvider provider;
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter, fastConfig());

    adapter.embedChunks({QStringLiteral("one two three"), QStringLiteral("  four   five ")});
    sv::EmbeddingUsage usage = adapter.usage();
    QCOMPARE(usage.callCount, int64_t(1));
    QCOMPARE(usage.tokenCount, int64_t(5));
    QCOMPARE(usage.errorCount, int64_t(0));

    adapter.resetUsage();
    QCOMPARE(adapter.usage().callCount, int64_t(0));
}

// ── Retry policy ─────────────────────────────────────────────────

void TestEmbeddingAdapter::testRateLimitRetriesThenSucceeds()
{
    FakeEmbeddingProvider provider;
    provider.queueFailure(ProviderStatus::Code::RateLimited, 429);
    provider.queueFailure(ProviderStatus::Code::QuotaExceeded, 429);
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter, fastConfig());

    const auto vectors = adapter.embedChunks(numberedTexts(3));
    QCOMPARE(static_cast<int>(vectors.size()), 3);
    QCOMPARE(provider.batchCalls(), 3);
    // Only the attempt that returned vectors counts as a call.
    QCOMPARE(adapter.usage().callCount, int64_t(1));
    QCOMPARE(adapter.usage().errorCount, int64_t(2));
}

void TestEmbeddingAdapter::testInvalidRequestIsFatal()
{
    FakeEmbeddingProvider provider;
    provider.queueFailure(ProviderStatus::Code::InvalidRequest, 400, QStringLiteral("input too long"));
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter, fastConfig());

    try {
        adapter.embedChunks(numberedTexts(2));
        QFAIL("expected EmbeddingError");
    } catch (const sv::EmbeddingError& e) {
        QVERIFY(!e.retryable());
        QCOMPARE(e.httpStatus(), 400);
    }
    QCOMPARE(provider.batchCalls(), 1);
}

void TestEmbeddingAdapter::testExhaustedRetriesThrowRetryable()
{
    FakeEmbeddingProvider provider;
    for (int i = 0; i < 3; ++i) {
        provider.queueFailure(ProviderStatus::Code::Unavailable, 503);
    }
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter, fastConfig(2));

    try {
        adapter.embedQuery(QStringLiteral("anything"));
        QFAIL("expected EmbeddingError");
    } catch (const sv::EmbeddingError& e) {
        QVERIFY(e.retryable());
        QCOMPARE(e.httpStatus(), 503);
    }
    QCOMPARE(provider.queryCalls(), 3);
    QCOMPARE(adapter.usage().callCount, int64_t(0));
    QCOMPARE(adapter.usage().errorCount, int64_t(3));
}

void TestEmbeddingAdapter::testVectorCountMismatchIsFatal()
{
    FakeEmbeddingProvider provider;
    provider.dropOneVectorOnNextBatch();
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter, fastConfig());

    QVERIFY_THROWS_EXCEPTION(sv::EmbeddingError, adapter.embedChunks(numberedTexts(4)));
    QCOMPARE(provider.batchCalls(), 1);
}

// ── Classification & backoff ─────────────────────────────────────

void TestEmbeddingAdapter::testClassifyTypedCodes()
{
    using Kind = EmbeddingAdapter::FailureKind;
    QCOMPARE(EmbeddingAdapter::classify({ProviderStatus::Code::RateLimited, 0, {}}), Kind::RateLimited);
    QCOMPARE(EmbeddingAdapter::classify({ProviderStatus::Code::QuotaExceeded, 0, {}}), Kind::RateLimited);
    QCOMPARE(EmbeddingAdapter::classify({ProviderStatus::Code::InvalidRequest, 0, {}}), Kind::Fatal);
    QCOMPARE(EmbeddingAdapter::classify({ProviderStatus::Code::Timeout, 0, {}}), Kind::Transient);
    QCOMPARE(EmbeddingAdapter::classify({ProviderStatus::Code::Unavailable, 503, {}}), Kind::Transient);
}

void TestEmbeddingAdapter::testClassifyUnknownFallsBackToMessage()
{
    using Kind = EmbeddingAdapter::FailureKind;
    const auto unknown = [](int http, const char* msg) {
        return ProviderStatus{ProviderStatus::Code::Unknown, http, QString::fromLatin1(msg)};
    };
    QCOMPARE(EmbeddingAdapter::classify(unknown(429, "")), Kind::RateLimited);
    QCOMPARE(EmbeddingAdapter::classify(unknown(0, "Rate limit reached")), Kind::RateLimited);
    QCOMPARE(EmbeddingAdapter::classify(unknown(0, "Error 400: invalid input")), Kind::Fatal);
    QCOMPARE(EmbeddingAdapter::classify(unknown(0, "connection reset by peer")), Kind::Transient);
}

void TestEmbeddingAdapter::testBackoffIsExponential()
{
    FakeEmbeddingProvider provider;
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter); // default delays

    using Kind = EmbeddingAdapter::FailureKind;
    QCOMPARE(adapter.backoffDelay(Kind::RateLimited, 0).count(), 1000LL);
    QCOMPARE(adapter.backoffDelay(Kind::RateLimited, 1).count(), 2000LL);
    QCOMPARE(adapter.backoffDelay(Kind::RateLimited, 2).count(), 4000LL);
    QCOMPARE(adapter.backoffDelay(Kind::Transient, 0).count(), 5000LL);
    QCOMPARE(adapter.backoffDelay(Kind::Transient, 1).count(), 10000LL);
}

// ── Cancellation ─────────────────────────────────────────────────

void TestEmbeddingAdapter::testCancelBeforeCall()
{
    FakeEmbeddingProvider provider;
    sv::RateLimiter limiter({0});
    EmbeddingAdapter adapter(provider, limiter, fastConfig());

    adapter.requestCancel();
    QVERIFY(adapter.isCancelRequested());
    QVERIFY_THROWS_EXCEPTION(sv::EmbeddingError, adapter.embedQuery(QStringLiteral("q")));
    QCOMPARE(provider.queryCalls(), 0);

    adapter.clearCancel();
    QCOMPARE(static_cast<int>(adapter.embedQuery(QStringLiteral("q")).size()), provider.dimensions());
}

void TestEmbeddingAdapter::testCancelWakesBackoff()
{
    FakeEmbeddingProvider provider;
    provider.queueFailure(ProviderStatus::Code::Unavailable, 503);
    sv::RateLimiter limiter({0});
    sv::EmbeddingConfig config = fastConfig();
    config.transientBaseDelayMs = 30000;
    EmbeddingAdapter adapter(provider, limiter, config);

    std::thread canceller([&adapter]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        adapter.requestCancel();
    });

    QElapsedTimer timer;
    timer.start();
    bool threw = false;
    try {
        adapter.embedQuery(QStringLiteral("q"));
    } catch (const sv::EmbeddingError& e) {
        threw = true;
        QVERIFY(!e.retryable());
    }
    canceller.join();

    QVERIFY(threw);
    QVERIFY(timer.elapsed() < 5000);
}

QTEST_MAIN(TestEmbeddingAdapter)
#include "test_embedding_adapter.moc"
