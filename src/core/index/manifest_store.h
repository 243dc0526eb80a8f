#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

struct sqlite3;

namespace sv {

// Input for ManifestStore::addDocument.
struct DocumentRef {
    QString path;
    QString mimeType;
    QString scope;
    QDateTime sourceMtime;
    QString fileHash;
    QJsonObject metadata;
    DocumentStatus status = DocumentStatus::Pending;
};

// A prepared document version for ManifestStore::commitDocument. Ids are
// chosen by the caller so vectors can be written under them first.
struct StagedDocument {
    QString docId;
    DocumentRef doc;
    std::vector<Chunk> chunks;
    std::vector<QString> chunkIds; // parallel to chunks
    QString extractor;
    QString extractorVersion;
    QString embeddingModel;        // empty: no embedding rows
    QString embeddingModelVersion; // vector_ref of each row is its chunk id
};

struct DocumentRow {
    QString docId;
    QString path;
    QString mimeType;
    QString scope;
    QDateTime sourceMtime;
    QString fileHash;
    QJsonObject metadata;
    QDateTime ingestedAt;
    DocumentStatus status = DocumentStatus::Pending;

    // metadata["risk_level"], Safe when absent or unknown.
    RiskLevel riskLevel() const;
};

struct ChunkRow {
    QString chunkId;
    QString docId;
    int chunkIndex = 0;
    int64_t offsetStart = 0;
    int64_t offsetEnd = 0;
    QString chunkHash;
    int tokenCount = 0;
    QString extractor;
    QString extractorVersion;
    QString scope;
    QString text;
    QDateTime createdAt;
};

// Chunk text joined with its owning document, used to feed the lexical index
// and to hydrate lexical-only retrieval hits.
struct ChunkText {
    QString chunkId;
    QString docId;
    QString path;
    QString scope;
    QString text;
    int chunkIndex = 0;
    RiskLevel riskLevel = RiskLevel::Safe;
    QJsonObject metadata;
};

struct EmbeddingRow {
    QString embeddingId;
    QString chunkId;
    QString model;
    QString modelVersion;
    QDateTime embeddedAt;
    QString vectorRef;
};

struct IngestJobRow {
    QString jobId;
    QDateTime startedAt;
    std::optional<QDateTime> completedAt;
    JobStatus status = JobStatus::Running;
    int64_t docsProcessed = 0;
    int64_t chunksCreated = 0;
    int64_t embeddingsCreated = 0;
    std::optional<QString> errorMessage;
};

struct ManifestStatistics {
    int64_t totalDocuments = 0;
    int64_t totalChunks = 0;
    int64_t totalEmbeddings = 0;
    int64_t totalIngestJobs = 0;
    std::map<QString, int64_t> documentsByStatus;
    std::map<QString, int64_t> documentsByScope;
    std::map<QString, int64_t> chunksByScope;
    std::map<QString, int64_t> jobsByStatus;
    int schemaVersion = 0;

    QJsonObject toJson() const;
};

// ManifestStore: system of record for documents, chunks, embeddings and
// ingest jobs, backed by SQLite.
//
// Every mutating operation runs in its own transaction and rolls back on any
// error. Uniqueness and foreign-key violations raise ManifestIntegrityError;
// other storage failures raise ManifestError.
//
// Connection model:
//   - file-backed: each call opens its own connection and commits before
//     returning, so concurrent callers only contend on SQLite's own locks
//   - ":memory:": one connection lives as long as the store (a fresh
//     connection would see an empty database) and calls are serialized on
//     a mutex
class ManifestStore {
public:
    static constexpr const char* kInMemoryPath = ":memory:";

    ~ManifestStore();

    ManifestStore(const ManifestStore&) = delete;
    ManifestStore& operator=(const ManifestStore&) = delete;

    // Open or create the manifest and migrate it to the latest schema.
    // Returns nullptr if the database cannot be opened or migrated.
    static std::unique_ptr<ManifestStore> open(const QString& dbPath);

    const QString& path() const { return m_path; }
    bool isInMemory() const { return m_persistentDb != nullptr; }
    int schemaVersion() const;

    // ── Documents ───────────────────────────────────────────

    // Returns the new doc_id. Throws ManifestIntegrityError if path exists.
    QString addDocument(const DocumentRef& doc);

    // Fresh row id (UUID without braces) for StagedDocument.
    static QString newRowId();

    // Writes a staged document with its chunks and embedding rows in one
    // transaction, after deleting replacedDocId (if set) and its rows. On any
    // error nothing changes.
    void commitDocument(const StagedDocument& staged,
                        const std::optional<QString>& replacedDocId = std::nullopt);

    std::optional<DocumentRow> getDocument(const QString& docId) const;
    std::optional<DocumentRow> getDocumentByPath(const QString& path) const;

    // Returns false if the document does not exist.
    bool updateDocumentStatus(const QString& docId, DocumentStatus status);
    bool markStale(const QString& docId);

    std::vector<DocumentRow> listDocuments(const std::optional<QString>& scope = std::nullopt,
                                           const std::optional<DocumentStatus>& status = std::nullopt) const;
    std::vector<DocumentRow> getStaleDocuments(const std::optional<QString>& scope = std::nullopt) const;

    // Deletes the document with its chunks and their embeddings.
    // Returns false if the document does not exist.
    bool deleteDocument(const QString& docId);

    // ── Chunks ──────────────────────────────────────────────

    // Inserts all chunks of a document atomically; scope is inherited from
    // the document. chunkIndex must be strictly increasing. Returns chunk ids
    // in input order.
    std::vector<QString> addChunks(const QString& docId,
                                   const std::vector<Chunk>& chunks,
                                   const QString& extractor,
                                   const QString& extractorVersion);

    std::optional<ChunkRow> getChunk(const QString& chunkId) const;
    std::vector<ChunkRow> getChunksForDocument(const QString& docId) const;
    int deleteChunksForDocument(const QString& docId);

    // Chunk texts of ingested (or stale, not yet replaced) documents in scope.
    std::vector<ChunkText> listChunkTexts(const QString& scope) const;
    std::optional<ChunkText> getChunkText(const QString& chunkId) const;

    // ── Embeddings ──────────────────────────────────────────

    // Returns the new embedding_id. Throws ManifestIntegrityError for an
    // unknown chunk or a second embedding of the same (chunk, model, version).
    QString addEmbedding(const QString& chunkId,
                         const QString& model,
                         const QString& modelVersion,
                         const QString& vectorRef);

    bool hasEmbedding(const QString& chunkId, const QString& model,
                      const QString& modelVersion) const;
    std::vector<EmbeddingRow> getEmbeddingsForChunk(const QString& chunkId) const;
    int64_t countEmbeddingsForDocument(const QString& docId) const;

    // ── Ingest jobs ─────────────────────────────────────────

    QString startIngestJob();

    // Sets absolute progress counters. Refused (returns false) when the job is
    // not running or any counter would decrease.
    bool updateIngestJob(const QString& jobId, int64_t docsProcessed,
                         int64_t chunksCreated, int64_t embeddingsCreated);

    // Moves a running job to a terminal status.
    bool completeIngestJob(const QString& jobId,
                           JobStatus status = JobStatus::Completed,
                           const std::optional<QString>& errorMessage = std::nullopt);

    std::optional<IngestJobRow> getIngestJob(const QString& jobId) const;

    // ── Maintenance ─────────────────────────────────────────

    ManifestStatistics statistics() const;
    bool vacuum();

private:
    class Session;

    explicit ManifestStore(QString path, sqlite3* persistentDb);

    template <typename Fn>
    auto inTransaction(Fn&& fn);

    static sqlite3* openConnection(const QString& path);

    QString m_path;
    sqlite3* m_persistentDb = nullptr;
    mutable std::mutex m_mutex;
};

} // namespace sv
