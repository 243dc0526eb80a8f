#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "core/embedding/embedding_adapter.h"
#include "core/embedding/rate_limiter.h"
#include "core/extraction/extractor_registry.h"
#include "core/index/manifest_store.h"
#include "core/indexing/chunker.h"
#include "core/indexing/ingest_pipeline.h"
#include "core/retrieval/hybrid_retriever.h"
#include "Support/fake_providers.h"

#include <memory>

using sv::DocumentSource;
using sv::IngestOutcome;
using sv::IngestPipeline;

namespace {

sv::ChunkerConfig smallChunks()
{
    sv::ChunkerConfig config;
    config.targetTokens = 40;
    config.overlapTokens = 5;
    config.minTokens = 5;
    config.maxTokens = 200;
    return config;
}

sv::EmbeddingConfig fastEmbedding()
{
    sv::EmbeddingConfig config;
    config.batchSize = 4;
    config.maxRetries = 1;
    config.retryBaseDelayMs = 1;
    config.transientBaseDelayMs = 1;
    return config;
}

QString words(const QString& prefix, int n)
{
    QStringList list;
    for (int i = 0; i < n; ++i) {
        list.append(QStringLiteral("%1%2").arg(prefix).arg(i));
    }
    return list.join(QLatin1Char(' '));
}

} // namespace

class TestIngestPipeline : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testIngestCreatesChunksAndEmbeddings();
    void testPayloadCarriesRiskAndScope();
    void testUnchangedFileSkipped();
    void testChangedFileReplaced();
    void testFailureIsolatedPerDocument();
    void testAllFailedMarksJobFailed();
    void testEmbeddingFailureLeavesNoVectors();
    void testFailedReplacementKeepsPreviousVersion();
    void testRejectedVectorWritesFail();
    void testUnexpectedErrorMarksDocumentFailed();
    void testMissingFileAndEmptyScope();
    void testEmptyFileIngestsWithoutChunks();
    void testRemoveDocument();
    void testAttachedRetrieverSeesNewChunks();

private:
    QString writeFile(const QString& name, const QString& content);
    DocumentSource source(const QString& path, const QString& risk = QStringLiteral("safe")) const;

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<sv::ManifestStore> m_manifest;
    std::unique_ptr<sv::ExtractorRegistry> m_registry;
    std::unique_ptr<sv::Chunker> m_chunker;
    std::unique_ptr<sv::test::FakeEmbeddingProvider> m_provider;
    std::unique_ptr<sv::RateLimiter> m_limiter;
    std::unique_ptr<sv::EmbeddingAdapter> m_adapter;
    std::unique_ptr<sv::test::FakeVectorIndex> m_vectors;
    std::unique_ptr<IngestPipeline> m_pipeline;
};

// ── Fixture ──────────────────────────────────────────────────────

void TestIngestPipeline::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_manifest = sv::ManifestStore::open(m_dir->filePath(QStringLiteral("manifest.db")));
    QVERIFY(m_manifest);
    m_registry = sv::ExtractorRegistry::withDefaults();
    m_chunker = std::make_unique<sv::Chunker>(smallChunks());
    m_provider = std::make_unique<sv::test::FakeEmbeddingProvider>();
    m_limiter = std::make_unique<sv::RateLimiter>(sv::RateLimiterConfig{0});
    m_adapter = std::make_unique<sv::EmbeddingAdapter>(*m_provider, *m_limiter, fastEmbedding());
    m_vectors = std::make_unique<sv::test::FakeVectorIndex>();
    m_pipeline = std::make_unique<IngestPipeline>(*m_manifest, *m_registry, *m_chunker,
                                                  *m_adapter, *m_vectors);
}

void TestIngestPipeline::cleanup()
{
    m_pipeline.reset();
    m_vectors.reset();
    m_adapter.reset();
    m_limiter.reset();
    m_provider.reset();
    m_chunker.reset();
    m_registry.reset();
    m_manifest.reset();
    m_dir.reset();
}

QString TestIngestPipeline::writeFile(const QString& name, const QString& content)
{
    const QString path = m_dir->filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(content.toUtf8());
    file.close();
    return QFileInfo(path).absoluteFilePath();
}

DocumentSource TestIngestPipeline::source(const QString& path, const QString& risk) const
{
    DocumentSource src;
    src.path = path;
    src.scope = QStringLiteral("kb");
    src.metadata[QStringLiteral("risk_level")] = risk;
    return src;
}

// ── Tests ────────────────────────────────────────────────────────

void TestIngestPipeline::testIngestCreatesChunksAndEmbeddings()
{
    const QString longText = words(QStringLiteral("alpha"), 120);
    const QString a = writeFile(QStringLiteral("a.txt"), longText);
    const QString b = writeFile(QStringLiteral("b.md"),
                                QStringLiteral("# Setup\n\n") + words(QStringLiteral("beta"), 30));

    const sv::IngestReport report = m_pipeline->ingest({source(a), source(b)});
    QCOMPARE(report.status, sv::JobStatus::Completed);
    QCOMPARE(report.docsProcessed, int64_t(2));
    QCOMPARE(report.docsFailed, int64_t(0));
    QCOMPARE(report.chunksCreated, report.embeddingsCreated);
    QCOMPARE(m_vectors->count(), report.chunksCreated);

    const auto docA = m_manifest->getDocumentByPath(a);
    QVERIFY(docA.has_value());
    QCOMPARE(docA->status, sv::DocumentStatus::Ingested);
    QCOMPARE(docA->fileHash, IngestPipeline::computeFileHash(a));
    const int expectedA = m_chunker->estimateChunkCount(longText);
    QCOMPARE(static_cast<int>(m_manifest->getChunksForDocument(docA->docId).size()), expectedA);
    QCOMPARE(m_manifest->countEmbeddingsForDocument(docA->docId), int64_t(expectedA));

    const auto docB = m_manifest->getDocumentByPath(b);
    QCOMPARE(docB->mimeType, QStringLiteral("text/markdown"));

    const auto job = m_manifest->getIngestJob(report.jobId);
    QVERIFY(job.has_value());
    QCOMPARE(job->status, sv::JobStatus::Completed);
    QCOMPARE(job->docsProcessed, int64_t(2));
    QCOMPARE(job->chunksCreated, report.chunksCreated);
    QCOMPARE(job->embeddingsCreated, report.embeddingsCreated);
    QVERIFY(!job->errorMessage.has_value());

    // Each chunk is embedded under the provider's model identity.
    const auto chunk = m_manifest->getChunksForDocument(docA->docId).front();
    QVERIFY(m_manifest->hasEmbedding(chunk.chunkId, QStringLiteral("fake-embed"), QStringLiteral("1")));

    QCOMPARE(report.toJson().value(QStringLiteral("outcomes")).toArray().size(), 2);
}

void TestIngestPipeline::testPayloadCarriesRiskAndScope()
{
    const QString path = writeFile(QStringLiteral("wipe.txt"), QStringLiteral("drop every table"));
    m_pipeline->ingest({source(path, QStringLiteral("dangerous"))});

    const auto doc = m_manifest->getDocumentByPath(path);
    const auto chunks = m_manifest->getChunksForDocument(doc->docId);
    QCOMPARE(static_cast<int>(chunks.size()), 1);

    const auto payload = m_vectors->payloadOf(chunks.front().chunkId);
    QVERIFY(payload.has_value());
    QCOMPARE(payload->value(QStringLiteral("risk_level")).toString(), QStringLiteral("dangerous"));
    QCOMPARE(payload->value(QStringLiteral("scope")).toString(), QStringLiteral("kb"));
    QCOMPARE(payload->value(QStringLiteral("doc_id")).toString(), doc->docId);
    QCOMPARE(payload->value(QStringLiteral("path")).toString(), path);
    QCOMPARE(payload->value(QStringLiteral("text")).toString(), QStringLiteral("drop every table"));
    QCOMPARE(payload->value(QStringLiteral("chunk_index")).toInt(), 0);
    QCOMPARE(doc->riskLevel(), sv::RiskLevel::Dangerous);
}

void TestIngestPipeline::testUnchangedFileSkipped()
{
    const QString path = writeFile(QStringLiteral("same.txt"), words(QStringLiteral("gamma"), 60));
    const sv::IngestReport first = m_pipeline->ingest({source(path)});
    const int64_t vectorsBefore = m_vectors->count();
    const int batchesBefore = m_provider->batchCalls();

    const sv::IngestReport second = m_pipeline->ingest({source(path)});
    QCOMPARE(second.docsSkipped, int64_t(1));
    QCOMPARE(second.chunksCreated, int64_t(0));
    QCOMPARE(second.outcomes.front().status, IngestOutcome::Status::Skipped);
    QCOMPARE(second.outcomes.front().docId, first.outcomes.front().docId);
    QCOMPARE(second.status, sv::JobStatus::Completed);
    QCOMPARE(m_vectors->count(), vectorsBefore);
    QCOMPARE(m_provider->batchCalls(), batchesBefore);
    QCOMPARE(m_manifest->statistics().totalDocuments, int64_t(1));
}

void TestIngestPipeline::testChangedFileReplaced()
{
    const QString path = writeFile(QStringLiteral("doc.txt"), words(QStringLiteral("old"), 90));
    const sv::IngestReport first = m_pipeline->ingest({source(path)});
    const QString oldDocId = first.outcomes.front().docId;
    const auto oldChunks = m_manifest->getChunksForDocument(oldDocId);
    QVERIFY(oldChunks.size() > 1);

    writeFile(QStringLiteral("doc.txt"), words(QStringLiteral("new"), 20));
    const sv::IngestReport second = m_pipeline->ingest({source(path)});
    QCOMPARE(second.outcomes.front().status, IngestOutcome::Status::Replaced);

    const QString newDocId = second.outcomes.front().docId;
    QVERIFY(newDocId != oldDocId);
    QVERIFY(!m_manifest->getDocument(oldDocId).has_value());
    for (const sv::ChunkRow& chunk : oldChunks) {
        QVERIFY(!m_vectors->payloadOf(chunk.chunkId).has_value());
        QVERIFY(!m_manifest->getChunk(chunk.chunkId).has_value());
    }
    QCOMPARE(m_vectors->count(), int64_t(second.chunksCreated));
    QCOMPARE(m_manifest->statistics().totalDocuments, int64_t(1));
}

void TestIngestPipeline::testFailureIsolatedPerDocument()
{
    const QString good = writeFile(QStringLiteral("good.txt"), QStringLiteral("useful content here"));
    const QString bad = writeFile(QStringLiteral("blob.dat"), QStringLiteral("\x01\x02"));

    DocumentSource badSource = source(bad);
    badSource.mimeType = QStringLiteral("application/x-unknown");

    const sv::IngestReport report = m_pipeline->ingest({badSource, source(good)});
    QCOMPARE(report.status, sv::JobStatus::Completed);
    QCOMPARE(report.docsProcessed, int64_t(2));
    QCOMPARE(report.docsFailed, int64_t(1));
    QCOMPARE(report.outcomes[0].status, IngestOutcome::Status::Failed);
    QVERIFY(!report.outcomes[0].error.isEmpty());
    QCOMPARE(report.outcomes[1].status, IngestOutcome::Status::Ingested);

    QCOMPARE(m_manifest->getDocumentByPath(bad)->status, sv::DocumentStatus::Failed);
    const auto job = m_manifest->getIngestJob(report.jobId);
    QVERIFY(job->errorMessage.has_value());
    QVERIFY(job->errorMessage->contains(QStringLiteral("blob.dat")));
}

void TestIngestPipeline::testAllFailedMarksJobFailed()
{
    const QString bad = writeFile(QStringLiteral("x.dat"), QStringLiteral("zz"));
    DocumentSource badSource = source(bad);
    badSource.mimeType = QStringLiteral("application/x-unknown");

    const sv::IngestReport report = m_pipeline->ingest({badSource});
    QCOMPARE(report.status, sv::JobStatus::Failed);
    QCOMPARE(m_manifest->getIngestJob(report.jobId)->status, sv::JobStatus::Failed);

    // An empty batch completes.
    QCOMPARE(m_pipeline->ingest({}).status, sv::JobStatus::Completed);
}

void TestIngestPipeline::testEmbeddingFailureLeavesNoVectors()
{
    const QString path = writeFile(QStringLiteral("big.txt"), words(QStringLiteral("delta"), 250));
    QVERIFY(m_chunker->estimateChunkCount(words(QStringLiteral("delta"), 250)) > 4);

    m_provider->queueFailure(sv::ProviderStatus::Code::InvalidRequest, 400,
                             QStringLiteral("input too long"));

    const sv::IngestReport report = m_pipeline->ingest({source(path)});
    QCOMPARE(report.outcomes.front().status, IngestOutcome::Status::Failed);
    QVERIFY(report.outcomes.front().error.contains(QStringLiteral("input too long")));
    QCOMPARE(m_vectors->count(), int64_t(0));

    const auto doc = m_manifest->getDocumentByPath(path);
    QCOMPARE(doc->status, sv::DocumentStatus::Failed);
    QCOMPARE(m_manifest->countEmbeddingsForDocument(doc->docId), int64_t(0));
    QVERIFY(m_manifest->getChunksForDocument(doc->docId).empty());

    // The next run replaces the failed document.
    const sv::IngestReport retry = m_pipeline->ingest({source(path)});
    QCOMPARE(retry.outcomes.front().status, IngestOutcome::Status::Replaced);
    QCOMPARE(m_vectors->count(), retry.chunksCreated);
}

void TestIngestPipeline::testFailedReplacementKeepsPreviousVersion()
{
    const QString path = writeFile(QStringLiteral("guide.txt"),
                                   QStringLiteral("rotate the signing keys every quarter"));
    const sv::IngestReport first = m_pipeline->ingest({source(path)});
    const QString oldDocId = first.outcomes.front().docId;
    const QString oldChunkId = m_manifest->getChunksForDocument(oldDocId).front().chunkId;

    sv::HybridRetriever retriever(*m_adapter, *m_vectors, *m_manifest);
    m_pipeline->attachRetriever(&retriever);

    writeFile(QStringLiteral("guide.txt"), QStringLiteral("completely rewritten guidance"));
    m_provider->queueFailure(sv::ProviderStatus::Code::InvalidRequest, 400,
                             QStringLiteral("bad input"));
    const sv::IngestReport second = m_pipeline->ingest({source(path)});
    QCOMPARE(second.outcomes.front().status, IngestOutcome::Status::Failed);
    QCOMPARE(second.outcomes.front().docId, oldDocId);

    // The previous version is still indexed, now stale.
    const auto doc = m_manifest->getDocumentByPath(path);
    QCOMPARE(doc->docId, oldDocId);
    QCOMPARE(doc->status, sv::DocumentStatus::Stale);
    const auto texts = m_manifest->listChunkTexts(QStringLiteral("kb"));
    QCOMPARE(static_cast<int>(texts.size()), 1);
    QCOMPARE(texts.front().chunkId, oldChunkId);
    QVERIFY(texts.front().text.contains(QStringLiteral("signing keys")));
    QCOMPARE(m_vectors->count(), int64_t(1));
    QVERIFY(m_vectors->payloadOf(oldChunkId).has_value());

    const auto results = retriever.search(QStringLiteral("signing keys"), QStringLiteral("kb"));
    QVERIFY(!results.empty());
    QCOMPARE(results.front().chunkId, oldChunkId);

    // A later successful run replaces it and drops the old vectors.
    const sv::IngestReport third = m_pipeline->ingest({source(path)});
    QCOMPARE(third.outcomes.front().status, IngestOutcome::Status::Replaced);
    QVERIFY(!m_manifest->getDocument(oldDocId).has_value());
    QVERIFY(!m_vectors->payloadOf(oldChunkId).has_value());
    QCOMPARE(m_vectors->count(), int64_t(1));
    const auto after = retriever.search(QStringLiteral("rewritten guidance"), QStringLiteral("kb"));
    QVERIFY(!after.empty());
    QVERIFY(after.front().chunkId != oldChunkId);
    m_pipeline->attachRetriever(nullptr);
}

void TestIngestPipeline::testRejectedVectorWritesFail()
{
    const QString path = writeFile(QStringLiteral("v.txt"), QStringLiteral("vector store offline"));
    m_vectors->setRejectWrites(true);

    const sv::IngestReport report = m_pipeline->ingest({source(path)});
    QCOMPARE(report.outcomes.front().status, IngestOutcome::Status::Failed);
    QVERIFY(report.outcomes.front().error.contains(QStringLiteral("upserted 0 of 1")));
    QCOMPARE(m_manifest->getDocumentByPath(path)->status, sv::DocumentStatus::Failed);

    const sv::ManifestStatistics stats = m_manifest->statistics();
    QCOMPARE(stats.totalChunks, int64_t(0));
    QCOMPARE(stats.totalEmbeddings, int64_t(0));
}

void TestIngestPipeline::testUnexpectedErrorMarksDocumentFailed()
{
    const QString path = writeFile(QStringLiteral("u.txt"), words(QStringLiteral("zeta"), 90));
    QVERIFY(m_chunker->estimateChunkCount(words(QStringLiteral("zeta"), 90)) > 1);
    m_vectors->throwAfterWrites(1);

    QVERIFY_THROWS_EXCEPTION(std::runtime_error, m_pipeline->ingest({source(path)}));

    const auto doc = m_manifest->getDocumentByPath(path);
    QVERIFY(doc.has_value());
    QCOMPARE(doc->status, sv::DocumentStatus::Failed);
    QVERIFY(m_manifest->getChunksForDocument(doc->docId).empty());
    QCOMPARE(m_vectors->count(), int64_t(0));

    const sv::ManifestStatistics stats = m_manifest->statistics();
    QCOMPARE(stats.jobsByStatus.at(QStringLiteral("failed")), int64_t(1));
}

void TestIngestPipeline::testMissingFileAndEmptyScope()
{
    const sv::IngestReport missing = m_pipeline->ingest({source(m_dir->filePath(QStringLiteral("nope.txt")))});
    QCOMPARE(missing.outcomes.front().status, IngestOutcome::Status::Failed);
    QCOMPARE(m_manifest->statistics().totalDocuments, int64_t(0));

    const QString path = writeFile(QStringLiteral("s.txt"), QStringLiteral("text"));
    DocumentSource noScope = source(path);
    noScope.scope = QStringLiteral("  ");
    const sv::IngestReport rejected = m_pipeline->ingest({noScope});
    QCOMPARE(rejected.outcomes.front().status, IngestOutcome::Status::Failed);
    QVERIFY(!m_manifest->getDocumentByPath(path).has_value());
}

void TestIngestPipeline::testEmptyFileIngestsWithoutChunks()
{
    const QString path = writeFile(QStringLiteral("empty.txt"), QString());
    const sv::IngestReport report = m_pipeline->ingest({source(path)});
    QCOMPARE(report.outcomes.front().status, IngestOutcome::Status::Ingested);
    QCOMPARE(report.chunksCreated, int64_t(0));
    QCOMPARE(m_manifest->getDocumentByPath(path)->status, sv::DocumentStatus::Ingested);
    QCOMPARE(m_provider->batchCalls(), 0);
}

void TestIngestPipeline::testRemoveDocument()
{
    const QString path = writeFile(QStringLiteral("r.txt"), words(QStringLiteral("eps"), 70));
    m_pipeline->ingest({source(path)});
    QVERIFY(m_vectors->count() > 0);

    QVERIFY(m_pipeline->removeDocument(path));
    QCOMPARE(m_vectors->count(), int64_t(0));
    QVERIFY(!m_manifest->getDocumentByPath(path).has_value());
    QVERIFY(!m_pipeline->removeDocument(path));
}

void TestIngestPipeline::testAttachedRetrieverSeesNewChunks()
{
    sv::HybridRetriever retriever(*m_adapter, *m_vectors, *m_manifest);
    m_pipeline->attachRetriever(&retriever);

    const QString first = writeFile(QStringLiteral("one.txt"), QStringLiteral("general notes"));
    m_pipeline->ingest({source(first)});
    retriever.search(QStringLiteral("general"), QStringLiteral("kb"));
    QCOMPARE(retriever.metrics().lexicalRebuilds, int64_t(1));

    // Hide the new chunk from the vector side so only BM25 can find it.
    const QString second = writeFile(QStringLiteral("two.txt"), QStringLiteral("wombat migration routes"));
    m_pipeline->ingest({source(second)});
    const auto doc = m_manifest->getDocumentByPath(second);
    const QString chunkId = m_manifest->getChunksForDocument(doc->docId).front().chunkId;
    m_vectors->remove(chunkId);

    auto results = retriever.search(QStringLiteral("wombat"), QStringLiteral("kb"));
    QCOMPARE(retriever.metrics().lexicalRebuilds, int64_t(1));
    bool found = false;
    for (const auto& c : results) {
        found = found || c.chunkId == chunkId;
    }
    QVERIFY(found);

    QVERIFY(m_pipeline->removeDocument(second));
    results = retriever.search(QStringLiteral("wombat"), QStringLiteral("kb"));
    for (const auto& c : results) {
        QVERIFY(c.chunkId != chunkId);
    }
    m_pipeline->attachRetriever(nullptr);
}

QTEST_MAIN(TestIngestPipeline)
#include "test_ingest_pipeline.moc"
