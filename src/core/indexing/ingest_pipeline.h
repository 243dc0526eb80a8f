#pragma once

#include "core/index/manifest_store.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace sv {

class Chunker;
class EmbeddingAdapter;
class ExtractorRegistry;
class HybridRetriever;
class VectorIndexClient;

struct DocumentSource {
    QString path;
    std::optional<QString> mimeType; // guessed from the extension when unset
    QString scope;
    QJsonObject metadata;            // "risk_level" drives governance
};

// Outcome of one document within an ingest job.
struct IngestOutcome {
    enum class Status {
        Ingested,
        Skipped,   // same path and file hash as an ingested document
        Replaced,  // previous version removed and re-ingested
        Failed,
    };

    QString path;
    Status status = Status::Failed;
    QString docId;
    int chunks = 0;
    int embeddings = 0;
    QString error;
};

QString ingestOutcomeStatusToString(IngestOutcome::Status status);

struct IngestReport {
    QString jobId;
    JobStatus status = JobStatus::Running;
    int64_t docsProcessed = 0;
    int64_t docsSkipped = 0;
    int64_t docsFailed = 0;
    int64_t chunksCreated = 0;
    int64_t embeddingsCreated = 0;
    std::vector<IngestOutcome> outcomes;

    QJsonObject toJson() const;
};

// IngestPipeline: drives documents from disk into the manifest and the
// vector index under a single IngestJob.
//
// For each source:
//   1. Hash the file; an ingested document with the same hash is skipped
//   2. A changed document is marked stale and stays searchable
//   3. Extract text (ExtractorRegistry) and chunk it (Chunker)
//   4. Embed the chunks (EmbeddingAdapter) and upsert their vectors under
//      freshly staged ids
//   5. Commit the new document, chunk and embedding rows in one manifest
//      transaction that also deletes the previous version, then drop the
//      previous version's vectors
// A failure in steps 3-5 removes the staged vectors and leaves the previous
// version stale (or records a failed row for a new path); the batch goes on.
// The job ends completed, or failed when every attempted document failed.
class IngestPipeline {
public:
    IngestPipeline(ManifestStore& manifest,
                   const ExtractorRegistry& registry,
                   const Chunker& chunker,
                   EmbeddingAdapter& embedder,
                   VectorIndexClient& vectorIndex);

    IngestPipeline(const IngestPipeline&) = delete;
    IngestPipeline& operator=(const IngestPipeline&) = delete;

    // Keeps the retriever's lexical index in step with ingested chunks.
    // Not owned; pass nullptr to detach.
    void attachRetriever(HybridRetriever* retriever) { m_retriever = retriever; }

    IngestReport ingest(const std::vector<DocumentSource>& sources);

    // Removes a document's vectors and manifest rows. Returns false if the
    // path is not in the manifest.
    bool removeDocument(const QString& path);

    static QString computeFileHash(const QString& filePath);

private:
    IngestOutcome ingestOne(const DocumentSource& source);
    // Returns the chunk ids of the replaced version.
    std::vector<QString> stageAndCommit(StagedDocument& staged,
                                        const std::optional<DocumentRow>& existing);
    QString recordFailure(const StagedDocument& staged, const std::optional<DocumentRow>& existing);
    void purgeDocument(const QString& docId);
    void removeIndexedContent(const QString& docId, const std::vector<QString>& chunkIds);

    ManifestStore& m_manifest;
    const ExtractorRegistry& m_registry;
    const Chunker& m_chunker;
    EmbeddingAdapter& m_embedder;
    VectorIndexClient& m_vectorIndex;
    HybridRetriever* m_retriever = nullptr;
};

} // namespace sv
