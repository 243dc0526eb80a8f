#include "core/indexing/ingest_pipeline.h"

#include "core/embedding/embedding_adapter.h"
#include "core/extraction/extractor_registry.h"
#include "core/index/manifest_store.h"
#include "core/indexing/chunker.h"
#include "core/retrieval/hybrid_retriever.h"
#include "core/shared/errors.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index_client.h"

#include <QCryptographicHash>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>

namespace sv {

QString ingestOutcomeStatusToString(IngestOutcome::Status status)
{
    switch (status) {
    case IngestOutcome::Status::Ingested: return QStringLiteral("ingested");
    case IngestOutcome::Status::Skipped:  return QStringLiteral("skipped");
    case IngestOutcome::Status::Replaced: return QStringLiteral("replaced");
    case IngestOutcome::Status::Failed:   return QStringLiteral("failed");
    }
    return QStringLiteral("failed");
}

QJsonObject IngestReport::toJson() const
{
    QJsonArray outcomeArray;
    for (const IngestOutcome& o : outcomes) {
        QJsonObject item;
        item[QStringLiteral("path")] = o.path;
        item[QStringLiteral("status")] = ingestOutcomeStatusToString(o.status);
        item[QStringLiteral("doc_id")] = o.docId;
        item[QStringLiteral("chunks")] = o.chunks;
        item[QStringLiteral("embeddings")] = o.embeddings;
        if (!o.error.isEmpty()) {
            item[QStringLiteral("error")] = o.error;
        }
        outcomeArray.append(item);
    }

    QJsonObject json;
    json[QStringLiteral("job_id")] = jobId;
    json[QStringLiteral("status")] = jobStatusToString(status);
    json[QStringLiteral("docs_processed")] = static_cast<double>(docsProcessed);
    json[QStringLiteral("docs_skipped")] = static_cast<double>(docsSkipped);
    json[QStringLiteral("docs_failed")] = static_cast<double>(docsFailed);
    json[QStringLiteral("chunks_created")] = static_cast<double>(chunksCreated);
    json[QStringLiteral("embeddings_created")] = static_cast<double>(embeddingsCreated);
    json[QStringLiteral("outcomes")] = outcomeArray;
    return json;
}

// ── Construction ────────────────────────────────────────────

IngestPipeline::IngestPipeline(ManifestStore& manifest,
                               const ExtractorRegistry& registry,
                               const Chunker& chunker,
                               EmbeddingAdapter& embedder,
                               VectorIndexClient& vectorIndex)
    : m_manifest(manifest)
    , m_registry(registry)
    , m_chunker(chunker)
    , m_embedder(embedder)
    , m_vectorIndex(vectorIndex)
{
}

// ── Batch ───────────────────────────────────────────────────

IngestReport IngestPipeline::ingest(const std::vector<DocumentSource>& sources)
{
    IngestReport report;
    report.jobId = m_manifest.startIngestJob();

    QElapsedTimer timer;
    timer.start();
    LOG_INFO(svIngest, "Ingest job %s started: %d documents",
             qPrintable(report.jobId), static_cast<int>(sources.size()));

    QString firstError;
    try {
        for (const DocumentSource& source : sources) {
            IngestOutcome outcome = ingestOne(source);

            ++report.docsProcessed;
            report.chunksCreated += outcome.chunks;
            report.embeddingsCreated += outcome.embeddings;
            if (outcome.status == IngestOutcome::Status::Skipped) {
                ++report.docsSkipped;
            } else if (outcome.status == IngestOutcome::Status::Failed) {
                ++report.docsFailed;
                if (firstError.isEmpty()) {
                    firstError = QStringLiteral("%1: %2").arg(outcome.path, outcome.error);
                }
            }
            report.outcomes.push_back(std::move(outcome));

            if (!m_manifest.updateIngestJob(report.jobId, report.docsProcessed,
                                            report.chunksCreated, report.embeddingsCreated)) {
                LOG_WARN(svIngest, "Progress update refused for job %s", qPrintable(report.jobId));
            }
        }
    } catch (const std::exception& e) {
        m_manifest.completeIngestJob(report.jobId, JobStatus::Failed, QString::fromUtf8(e.what()));
        LOG_ERROR(svIngest, "Ingest job %s aborted: %s", qPrintable(report.jobId), e.what());
        throw;
    }

    const bool allFailed = !sources.empty() && report.docsFailed == report.docsProcessed;
    report.status = allFailed ? JobStatus::Failed : JobStatus::Completed;
    std::optional<QString> errorMessage;
    if (report.docsFailed > 0) {
        errorMessage = QStringLiteral("%1 of %2 documents failed; first: %3")
                           .arg(report.docsFailed)
                           .arg(report.docsProcessed)
                           .arg(firstError);
    }
    m_manifest.completeIngestJob(report.jobId, report.status, errorMessage);

    LOG_INFO(svIngest, "Ingest job %s %s in %lldms: processed=%lld skipped=%lld failed=%lld "
                       "chunks=%lld embeddings=%lld",
             qPrintable(report.jobId), qPrintable(jobStatusToString(report.status)),
             static_cast<long long>(timer.elapsed()),
             static_cast<long long>(report.docsProcessed),
             static_cast<long long>(report.docsSkipped),
             static_cast<long long>(report.docsFailed),
             static_cast<long long>(report.chunksCreated),
             static_cast<long long>(report.embeddingsCreated));
    return report;
}

// ── Single document ─────────────────────────────────────────

IngestOutcome IngestPipeline::ingestOne(const DocumentSource& source)
{
    IngestOutcome outcome;
    const QFileInfo info(source.path);
    outcome.path = info.absoluteFilePath();

    if (source.scope.trimmed().isEmpty()) {
        outcome.error = QStringLiteral("scope is required");
        LOG_WARN(svIngest, "Rejected %s: no scope", qPrintable(outcome.path));
        return outcome;
    }

    const std::optional<DocumentRow> existing = m_manifest.getDocumentByPath(outcome.path);

    const QString fileHash = computeFileHash(outcome.path);
    if (fileHash.isEmpty()) {
        outcome.error = QStringLiteral("file is missing or unreadable");
        LOG_WARN(svIngest, "Cannot read %s", qPrintable(outcome.path));
        if (existing) {
            m_manifest.updateDocumentStatus(existing->docId, DocumentStatus::Failed);
        }
        return outcome;
    }

    if (existing) {
        if (existing->status == DocumentStatus::Ingested && existing->fileHash == fileHash) {
            outcome.status = IngestOutcome::Status::Skipped;
            outcome.docId = existing->docId;
            LOG_DEBUG(svIngest, "Skipped (hash unchanged): %s", qPrintable(outcome.path));
            return outcome;
        }
        // The previous version stays searchable as stale until its
        // replacement commits.
        if (existing->status == DocumentStatus::Ingested) {
            m_manifest.markStale(existing->docId);
        }
        LOG_INFO(svIngest, "Content changed, replacing %s", qPrintable(outcome.path));
    }

    StagedDocument staged;
    staged.docId = ManifestStore::newRowId();
    staged.doc.path = outcome.path;
    staged.doc.mimeType = source.mimeType.value_or(ExtractorRegistry::mimeTypeForPath(outcome.path));
    staged.doc.scope = source.scope;
    staged.doc.sourceMtime = info.lastModified().toUTC();
    staged.doc.fileHash = fileHash;
    staged.doc.metadata = source.metadata;
    staged.doc.status = DocumentStatus::Ingested;

    std::vector<QString> replacedChunkIds;
    try {
        replacedChunkIds = stageAndCommit(staged, existing);
    } catch (const SieveError& e) {
        outcome.error = e.message();
        LOG_ERROR(svIngest, "Failed to ingest %s: %s", qPrintable(outcome.path), e.what());
        outcome.docId = recordFailure(staged, existing);
        return outcome;
    } catch (const std::exception& e) {
        LOG_ERROR(svIngest, "Unexpected error ingesting %s: %s", qPrintable(outcome.path), e.what());
        recordFailure(staged, existing);
        throw;
    }

    if (existing) {
        // Old rows went away with the commit; drop their vectors and terms.
        removeIndexedContent(existing->docId, replacedChunkIds);
    }
    if (m_retriever) {
        for (size_t i = 0; i < staged.chunks.size(); ++i) {
            m_retriever->indexChunkText(staged.chunkIds[i], staged.chunks[i].text, source.scope);
        }
    }

    outcome.docId = staged.docId;
    outcome.chunks = static_cast<int>(staged.chunks.size());
    outcome.embeddings = staged.embeddingModel.isEmpty() ? 0 : outcome.chunks;
    outcome.status = existing ? IngestOutcome::Status::Replaced : IngestOutcome::Status::Ingested;
    LOG_INFO(svIngest, "Ingested %s: %d chunks, %d embeddings",
             qPrintable(outcome.path), outcome.chunks, outcome.embeddings);
    return outcome;
}

std::vector<QString> IngestPipeline::stageAndCommit(StagedDocument& staged,
                                                    const std::optional<DocumentRow>& existing)
{
    const ExtractedText extracted = m_registry.extract(staged.doc.path, staged.doc.mimeType);
    staged.extractor = extracted.extractor;
    staged.extractorVersion = extracted.extractorVersion;
    staged.chunks = m_chunker.chunk(extracted.text, staged.doc.mimeType);
    if (staged.chunks.empty()) {
        LOG_WARN(svIngest, "No chunks produced for %s (empty content)", qPrintable(staged.doc.path));
    }
    for (size_t i = 0; i < staged.chunks.size(); ++i) {
        staged.chunkIds.push_back(ManifestStore::newRowId());
    }

    if (!staged.chunks.empty()) {
        std::vector<QString> texts;
        texts.reserve(staged.chunks.size());
        for (const Chunk& chunk : staged.chunks) {
            texts.push_back(chunk.text);
        }
        std::vector<std::vector<float>> vectors = m_embedder.embedChunks(texts);

        const RiskLevel risk =
            riskLevelFromString(staged.doc.metadata.value(QStringLiteral("risk_level")).toString());

        std::vector<VectorPoint> points;
        points.reserve(staged.chunks.size());
        for (size_t i = 0; i < staged.chunks.size(); ++i) {
            QJsonObject payload;
            payload[QStringLiteral("doc_id")] = staged.docId;
            payload[QStringLiteral("chunk_id")] = staged.chunkIds[i];
            payload[QStringLiteral("path")] = staged.doc.path;
            payload[QStringLiteral("scope")] = staged.doc.scope;
            payload[QStringLiteral("text")] = staged.chunks[i].text;
            payload[QStringLiteral("chunk_index")] = staged.chunks[i].chunkIndex;
            payload[QStringLiteral("risk_level")] = riskLevelToString(risk);
            points.push_back({staged.chunkIds[i], std::move(vectors[i]), payload});
        }

        const int written = m_vectorIndex.upsertBatch(points);
        if (written != static_cast<int>(points.size())) {
            throw VectorIndexError(QStringLiteral("upserted %1 of %2 vectors")
                                       .arg(written)
                                       .arg(static_cast<int>(points.size())));
        }
        staged.embeddingModel = m_embedder.model();
        staged.embeddingModelVersion = m_embedder.modelVersion();
    }

    std::vector<QString> replacedChunkIds;
    std::optional<QString> replacedDocId;
    if (existing) {
        replacedDocId = existing->docId;
        for (const ChunkRow& chunk : m_manifest.getChunksForDocument(existing->docId)) {
            replacedChunkIds.push_back(chunk.chunkId);
        }
    }
    m_manifest.commitDocument(staged, replacedDocId);
    return replacedChunkIds;
}

QString IngestPipeline::recordFailure(const StagedDocument& staged,
                                      const std::optional<DocumentRow>& existing)
{
    // Vectors written under the staged ids have no manifest rows.
    const int removed = m_vectorIndex.removeByDoc(staged.docId);
    if (removed > 0) {
        LOG_DEBUG(svIngest, "Removed %d staged vectors for %s", removed, qPrintable(staged.doc.path));
    }

    if (existing) {
        // A previous version with content stays stale; one that never had
        // content is still failed.
        const bool hadContent = existing->status == DocumentStatus::Ingested
            || existing->status == DocumentStatus::Stale;
        if (!hadContent) {
            m_manifest.updateDocumentStatus(existing->docId, DocumentStatus::Failed);
        }
        return existing->docId;
    }

    DocumentRef failed = staged.doc;
    failed.status = DocumentStatus::Failed;
    return m_manifest.addDocument(failed);
}

bool IngestPipeline::removeDocument(const QString& path)
{
    const auto existing = m_manifest.getDocumentByPath(QFileInfo(path).absoluteFilePath());
    if (!existing) {
        return false;
    }
    purgeDocument(existing->docId);
    LOG_INFO(svIngest, "Removed %s", qPrintable(existing->path));
    return true;
}

void IngestPipeline::purgeDocument(const QString& docId)
{
    std::vector<QString> chunkIds;
    for (const ChunkRow& chunk : m_manifest.getChunksForDocument(docId)) {
        chunkIds.push_back(chunk.chunkId);
    }
    removeIndexedContent(docId, chunkIds);
    if (!m_manifest.deleteDocument(docId)) {
        LOG_WARN(svIngest, "Document %s vanished before removal", qPrintable(docId));
    }
}

void IngestPipeline::removeIndexedContent(const QString& docId, const std::vector<QString>& chunkIds)
{
    if (m_retriever) {
        for (const QString& chunkId : chunkIds) {
            m_retriever->removeChunkText(chunkId);
        }
    }
    const int removed = m_vectorIndex.removeByDoc(docId);
    LOG_DEBUG(svIngest, "Removed %d vectors for doc %s", removed, qPrintable(docId));
}

QString IngestPipeline::computeFileHash(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return QString();
    }
    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        return QString();
    }
    return QString::fromLatin1(hash.result().toHex());
}

} // namespace sv
