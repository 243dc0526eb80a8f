#include <QtTest/QtTest>
#include "core/embedding/embedding_adapter.h"
#include "core/embedding/rate_limiter.h"
#include "core/index/manifest_store.h"
#include "core/retrieval/hybrid_retriever.h"
#include "core/shared/chunk.h"
#include "Support/fake_providers.h"

#include <cmath>
#include <memory>

using sv::GovernanceMode;
using sv::HybridRetriever;
using sv::RetrievalCandidate;

namespace {

// Manifest, vector index and retriever wired over the fake providers.
struct Harness {
    explicit Harness(const sv::RetrieverConfig& config = {})
        : limiter(sv::RateLimiterConfig{0})
        , adapter(provider, limiter)
        , manifest(sv::ManifestStore::open(QStringLiteral(":memory:")))
        , retriever(adapter, vectors, *manifest, config)
    {
    }

    // Stores one single-chunk document; indexVector=false leaves it
    // reachable only through the lexical path.
    QString addDoc(const QString& path, const QString& scope, const QString& text,
                   const QString& risk = QStringLiteral("safe"), bool indexVector = true)
    {
        sv::DocumentRef ref;
        ref.path = path;
        ref.mimeType = QStringLiteral("text/plain");
        ref.scope = scope;
        ref.fileHash = sv::computeChunkHash(text);
        ref.metadata[QStringLiteral("risk_level")] = risk;
        ref.metadata[QStringLiteral("section")] = QStringLiteral("intro");
        const QString docId = manifest->addDocument(ref);

        sv::Chunk chunk;
        chunk.text = text;
        chunk.offsetEnd = text.toUtf8().size();
        chunk.chunkHash = sv::computeChunkHash(text);
        chunk.tokenCount = static_cast<int>(text.split(QLatin1Char(' ')).size());
        const QString chunkId = manifest->addChunks(docId, {chunk}, QStringLiteral("text"),
                                                    QStringLiteral("1.0")).front();
        manifest->updateDocumentStatus(docId, sv::DocumentStatus::Ingested);

        if (indexVector) {
            QJsonObject payload;
            payload[QStringLiteral("doc_id")] = docId;
            payload[QStringLiteral("chunk_id")] = chunkId;
            payload[QStringLiteral("path")] = path;
            payload[QStringLiteral("scope")] = scope;
            payload[QStringLiteral("text")] = text;
            payload[QStringLiteral("chunk_index")] = 0;
            payload[QStringLiteral("risk_level")] = risk;
            payload[QStringLiteral("section")] = QStringLiteral("intro");
            vectors.upsert(chunkId, provider.vectorFor(text), payload);
        }
        return chunkId;
    }

    sv::test::FakeEmbeddingProvider provider;
    sv::RateLimiter limiter;
    sv::EmbeddingAdapter adapter;
    sv::test::FakeVectorIndex vectors;
    std::unique_ptr<sv::ManifestStore> manifest;
    HybridRetriever retriever;
};

const RetrievalCandidate* findChunk(const std::vector<RetrievalCandidate>& results,
                                    const QString& chunkId)
{
    for (const RetrievalCandidate& c : results) {
        if (c.chunkId == chunkId) {
            return &c;
        }
    }
    return nullptr;
}

} // namespace

class TestHybridRetriever : public QObject {
    Q_OBJECT

private slots:
    // ── Input guards ─────────────────────────────────────────────
    void testRejectsEmptyInputs();

    // ── Ranking ──────────────────────────────────────────────────
    void testMostRelevantFirst();
    void testCandidateFields();
    void testLexicalOnlyHitHydrated();
    void testEmptyVectorResultKeepsLexicalHits();
    void testFiltersApplyToLexicalHits();
    void testSemanticOnlyWhenLexicalDisabled();

    // ── Governance ───────────────────────────────────────────────
    void testReadOnlySuppressesDangerous();
    void testPermissionDampens();
    void testBypassIgnoresRisk();

    // ── Failure & caching ────────────────────────────────────────
    void testVectorFailureYieldsEmpty();
    void testQueryEmbeddingCached();

    // ── Lexical index maintenance ────────────────────────────────
    void testScopeSwitchRebuilds();
    void testIncrementalLexicalUpdate();
};

// ── Input guards ─────────────────────────────────────────────────

void TestHybridRetriever::testRejectsEmptyInputs()
{
    Harness h;
    h.addDoc(QStringLiteral("/a.txt"), QStringLiteral("kb"), QStringLiteral("rotate credentials"));

    QVERIFY(h.retriever.search(QString(), QStringLiteral("kb")).empty());
    QVERIFY(h.retriever.search(QStringLiteral("   "), QStringLiteral("kb")).empty());
    QVERIFY(h.retriever.search(QStringLiteral("rotate"), QString()).empty());
    QVERIFY(h.retriever.search(QStringLiteral("rotate"), QStringLiteral("kb"), 0).empty());
    QCOMPARE(h.vectors.searchCalls(), 0);
    QCOMPARE(h.provider.queryCalls(), 0);
}

// ── Ranking ──────────────────────────────────────────────────────

void TestHybridRetriever::testMostRelevantFirst()
{
    Harness h;
    const QString target = h.addDoc(QStringLiteral("/creds.md"), QStringLiteral("kb"),
                                     QStringLiteral("rotate the database credentials every quarter"));
    h.addDoc(QStringLiteral("/deploy.md"), QStringLiteral("kb"),
             QStringLiteral("the deploy pipeline runs database migrations"));
    h.addDoc(QStringLiteral("/coffee.md"), QStringLiteral("kb"),
             QStringLiteral("coffee machine cleaning schedule for the kitchen"));

    const auto results = h.retriever.search(QStringLiteral("rotate database credentials"),
                                            QStringLiteral("kb"), 10, GovernanceMode::Bypass);
    QVERIFY(!results.empty());
    QCOMPARE(results.front().chunkId, target);

    for (size_t i = 0; i < results.size(); ++i) {
        QCOMPARE(results[i].rank, static_cast<int>(i) + 1);
        if (i > 0) {
            QVERIFY(results[i - 1].score >= results[i].score);
        }
    }

    QCOMPARE(static_cast<int>(h.retriever.search(QStringLiteral("rotate database credentials"),
                                                 QStringLiteral("kb"), 1).size()), 1);
}

void TestHybridRetriever::testCandidateFields()
{
    sv::RetrieverConfig config;
    config.snippetChars = 12;
    Harness h(config);
    const QString chunkId = h.addDoc(QStringLiteral("/runbook.md"), QStringLiteral("ops"),
                                     QStringLiteral("restart the ingest worker after upgrades"),
                                     QStringLiteral("sensitive"));

    const auto results = h.retriever.search(QStringLiteral("restart ingest worker"),
                                            QStringLiteral("ops"), 5, GovernanceMode::Bypass);
    QCOMPARE(static_cast<int>(results.size()), 1);

    const RetrievalCandidate& c = results.front();
    QCOMPARE(c.chunkId, chunkId);
    QCOMPARE(c.path, QStringLiteral("/runbook.md"));
    QCOMPARE(c.scope, QStringLiteral("ops"));
    QCOMPARE(c.snippet, QStringLiteral("restart the "));
    QCOMPARE(c.riskLevel, sv::RiskLevel::Sensitive);
    QVERIFY(c.semanticScore > 0.0);
    QVERIFY(c.bm25Score.has_value());
    QCOMPARE(c.metadata.value(QStringLiteral("section")).toString(), QStringLiteral("intro"));
    QVERIFY(!c.metadata.contains(QStringLiteral("doc_id")));
    QVERIFY(!c.metadata.contains(QStringLiteral("text")));

    const QJsonObject json = c.toJson();
    QCOMPARE(json.value(QStringLiteral("chunk_id")).toString(), chunkId);
}

void TestHybridRetriever::testLexicalOnlyHitHydrated()
{
    Harness h;
    h.addDoc(QStringLiteral("/vec.md"), QStringLiteral("kb"),
             QStringLiteral("general onboarding notes for new staff"));
    const QString lexicalOnly = h.addDoc(QStringLiteral("/lex.md"), QStringLiteral("kb"),
                                         QStringLiteral("the zanzibar authorization model explained"),
                                         QStringLiteral("safe"), false);

    const auto results = h.retriever.search(QStringLiteral("zanzibar authorization"),
                                            QStringLiteral("kb"), 5);
    const RetrievalCandidate* hit = findChunk(results, lexicalOnly);
    QVERIFY(hit);
    QCOMPARE(hit->path, QStringLiteral("/lex.md"));
    QCOMPARE(hit->semanticScore, 0.0);
    QVERIFY(hit->bm25Score.has_value());
    QVERIFY(hit->snippet.startsWith(QStringLiteral("the zanzibar")));
    QCOMPARE(hit->metadata.value(QStringLiteral("section")).toString(), QStringLiteral("intro"));
}

void TestHybridRetriever::testEmptyVectorResultKeepsLexicalHits()
{
    Harness h;
    const QString strong = h.addDoc(QStringLiteral("/a.md"), QStringLiteral("kb"),
                                    QStringLiteral("failover failover runbook for the primary"),
                                    QStringLiteral("safe"), false);
    const QString weak = h.addDoc(QStringLiteral("/b.md"), QStringLiteral("kb"),
                                  QStringLiteral("failover notes and a short glossary"),
                                  QStringLiteral("safe"), false);
    QCOMPARE(h.vectors.count(), int64_t(0));

    const auto results = h.retriever.search(QStringLiteral("failover"), QStringLiteral("kb"), 5);
    QCOMPARE(static_cast<int>(results.size()), 2);
    QCOMPARE(results[0].chunkId, strong);
    QCOMPARE(results[1].chunkId, weak);
    for (const RetrievalCandidate& c : results) {
        QCOMPARE(c.semanticScore, 0.0);
        QVERIFY(c.bm25Score.has_value());
    }
    QCOMPARE(results[0].rank, 1);
}

void TestHybridRetriever::testFiltersApplyToLexicalHits()
{
    Harness h;
    h.addDoc(QStringLiteral("/safe.md"), QStringLiteral("kb"),
             QStringLiteral("zanzibar tuples for safe reads"));
    const QString dangerous = h.addDoc(QStringLiteral("/danger.md"), QStringLiteral("kb"),
                                       QStringLiteral("zanzibar admin override keys"),
                                       QStringLiteral("dangerous"), false);

    QJsonObject filters;
    filters[QStringLiteral("risk_level")] = QStringLiteral("safe");
    const auto results = h.retriever.search(QStringLiteral("zanzibar"), QStringLiteral("kb"),
                                            10, GovernanceMode::Bypass, filters);
    QVERIFY(!results.empty());
    QVERIFY(!findChunk(results, dangerous));
}

void TestHybridRetriever::testSemanticOnlyWhenLexicalDisabled()
{
    sv::RetrieverConfig config;
    config.enableLexical = false;
    Harness h(config);
    h.addDoc(QStringLiteral("/a.md"), QStringLiteral("kb"), QStringLiteral("alpha beta gamma"));
    h.addDoc(QStringLiteral("/b.md"), QStringLiteral("kb"), QStringLiteral("delta epsilon"),
             QStringLiteral("safe"), false);

    const auto results = h.retriever.search(QStringLiteral("alpha gamma"), QStringLiteral("kb"),
                                            5, GovernanceMode::Bypass);
    QCOMPARE(static_cast<int>(results.size()), 1);
    QVERIFY(!results.front().bm25Score.has_value());
    QCOMPARE(results.front().score, results.front().semanticScore);
    QVERIFY(!h.retriever.lexicalScope().has_value());
}

// ── Governance ───────────────────────────────────────────────────

void TestHybridRetriever::testReadOnlySuppressesDangerous()
{
    Harness h;
    const QString dangerous = h.addDoc(QStringLiteral("/wipe.sh.md"), QStringLiteral("kb"),
                                       QStringLiteral("drop production database tables"),
                                       QStringLiteral("dangerous"));
    const QString safe = h.addDoc(QStringLiteral("/backup.md"), QStringLiteral("kb"),
                                  QStringLiteral("backup the production database nightly"));
    h.addDoc(QStringLiteral("/coffee.md"), QStringLiteral("kb"),
             QStringLiteral("coffee machine cleaning schedule"));

    const auto results = h.retriever.search(QStringLiteral("drop production database tables"),
                                            QStringLiteral("kb"), 10, GovernanceMode::ReadOnly);
    QCOMPARE(static_cast<int>(results.size()), 3);
    QCOMPARE(results.front().chunkId, safe);

    const RetrievalCandidate* blocked = findChunk(results, dangerous);
    QVERIFY(blocked);
    QCOMPARE(blocked->score, 0.0);
    QCOMPARE(blocked->allowedInMode, sv::AllowedStatus::Blocked);
    QVERIFY(blocked->semanticScore > 0.0);
}

void TestHybridRetriever::testPermissionDampens()
{
    Harness h;
    const QString chunkId = h.addDoc(QStringLiteral("/keys.md"), QStringLiteral("kb"),
                                     QStringLiteral("signing keys live in the vault"),
                                     QStringLiteral("sensitive"));

    const auto bypass = h.retriever.search(QStringLiteral("signing keys vault"),
                                           QStringLiteral("kb"), 5, GovernanceMode::Bypass);
    const auto permission = h.retriever.search(QStringLiteral("signing keys vault"),
                                               QStringLiteral("kb"), 5, GovernanceMode::Permission);
    QCOMPARE(bypass.front().chunkId, chunkId);
    QCOMPARE(permission.front().allowedInMode, sv::AllowedStatus::PromptRequired);
    QVERIFY(std::abs(permission.front().score - 0.8 * bypass.front().score) < 1e-9);
}

void TestHybridRetriever::testBypassIgnoresRisk()
{
    Harness h;
    const QString dangerous = h.addDoc(QStringLiteral("/wipe.md"), QStringLiteral("kb"),
                                       QStringLiteral("drop production database tables"),
                                       QStringLiteral("dangerous"));
    h.addDoc(QStringLiteral("/backup.md"), QStringLiteral("kb"),
             QStringLiteral("backup the production database nightly"));

    const auto results = h.retriever.search(QStringLiteral("drop production database tables"),
                                            QStringLiteral("kb"), 10, GovernanceMode::Bypass);
    QCOMPARE(results.front().chunkId, dangerous);
    QCOMPARE(results.front().allowedInMode, sv::AllowedStatus::Allowed);
    QVERIFY(results.front().score > 0.0);
}

// ── Failure & caching ────────────────────────────────────────────

void TestHybridRetriever::testVectorFailureYieldsEmpty()
{
    Harness h;
    h.addDoc(QStringLiteral("/a.md"), QStringLiteral("kb"), QStringLiteral("alpha beta"));
    h.vectors.setFailSearch(true);

    QVERIFY(h.retriever.search(QStringLiteral("alpha"), QStringLiteral("kb")).empty());
    QCOMPARE(h.retriever.metrics().failedQueries, int64_t(1));
    QCOMPARE(h.retriever.metrics().queryCount, int64_t(1));

    h.vectors.setFailSearch(false);
    QVERIFY(!h.retriever.search(QStringLiteral("alpha"), QStringLiteral("kb")).empty());
}

void TestHybridRetriever::testQueryEmbeddingCached()
{
    Harness h;
    h.addDoc(QStringLiteral("/a.md"), QStringLiteral("kb"), QStringLiteral("alpha beta"));

    h.retriever.search(QStringLiteral("alpha"), QStringLiteral("kb"));
    h.retriever.search(QStringLiteral("alpha"), QStringLiteral("kb"));
    QCOMPARE(h.provider.queryCalls(), 1);

    const sv::RetrieverMetrics metrics = h.retriever.metrics();
    QCOMPARE(metrics.cacheMisses, int64_t(1));
    QCOMPARE(metrics.cacheHits, int64_t(1));
    QCOMPARE(metrics.toJson().value(QStringLiteral("query_count")).toInt(), 2);

    h.retriever.clearQueryCache();
    h.retriever.search(QStringLiteral("alpha"), QStringLiteral("kb"));
    QCOMPARE(h.provider.queryCalls(), 2);
}

// ── Lexical index maintenance ────────────────────────────────────

void TestHybridRetriever::testScopeSwitchRebuilds()
{
    Harness h;
    h.addDoc(QStringLiteral("/a.md"), QStringLiteral("alpha"), QStringLiteral("shared words here"));
    const QString inBeta = h.addDoc(QStringLiteral("/b.md"), QStringLiteral("beta"),
                                    QStringLiteral("shared words there"));

    h.retriever.search(QStringLiteral("shared words"), QStringLiteral("alpha"));
    QCOMPARE(h.retriever.lexicalScope().value_or(QString()), QStringLiteral("alpha"));
    h.retriever.search(QStringLiteral("shared words"), QStringLiteral("alpha"));
    QCOMPARE(h.retriever.metrics().lexicalRebuilds, int64_t(1));

    const auto results = h.retriever.search(QStringLiteral("shared words"), QStringLiteral("beta"));
    QCOMPARE(h.retriever.lexicalScope().value_or(QString()), QStringLiteral("beta"));
    QCOMPARE(h.retriever.metrics().lexicalRebuilds, int64_t(2));
    QCOMPARE(static_cast<int>(results.size()), 1);
    QCOMPARE(results.front().chunkId, inBeta);

    h.retriever.invalidateLexicalIndex();
    QVERIFY(!h.retriever.lexicalScope().has_value());
}

void TestHybridRetriever::testIncrementalLexicalUpdate()
{
    Harness h;
    h.addDoc(QStringLiteral("/a.md"), QStringLiteral("kb"), QStringLiteral("alpha beta"));
    h.retriever.search(QStringLiteral("alpha"), QStringLiteral("kb"));

    const QString added = h.addDoc(QStringLiteral("/late.md"), QStringLiteral("kb"),
                                   QStringLiteral("quokka habitat survey"),
                                   QStringLiteral("safe"), false);
    h.retriever.indexChunkText(added, QStringLiteral("quokka habitat survey"), QStringLiteral("kb"));

    auto results = h.retriever.search(QStringLiteral("quokka"), QStringLiteral("kb"));
    QVERIFY(findChunk(results, added));
    QCOMPARE(h.retriever.metrics().lexicalRebuilds, int64_t(1));

    h.retriever.removeChunkText(added);
    results = h.retriever.search(QStringLiteral("quokka"), QStringLiteral("kb"));
    QVERIFY(!findChunk(results, added));
}

QTEST_MAIN(TestHybridRetriever)
#include "test_hybrid_retriever.moc"
