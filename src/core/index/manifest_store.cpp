#include "core/index/manifest_store.h"
#include "core/index/migration.h"
#include "core/index/schema.h"
#include "core/shared/errors.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QUuid>

#include <sqlite3.h>

#include <type_traits>
#include <utility>

namespace sv {

namespace {

QString nowIso()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

QString toIso(const QDateTime& dt)
{
    return dt.isValid() ? dt.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime fromIso(const QString& str)
{
    if (str.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(str, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(str, Qt::ISODate);
    }
    return dt;
}

QString newId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QString metadataToText(const QJsonObject& metadata)
{
    return QString::fromUtf8(QJsonDocument(metadata).toJson(QJsonDocument::Compact));
}

QJsonObject metadataFromText(const QString& text)
{
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8());
    return doc.isObject() ? doc.object() : QJsonObject();
}

RiskLevel riskFromMetadata(const QJsonObject& metadata)
{
    return riskLevelFromString(metadata.value(QStringLiteral("risk_level")).toString());
}

[[noreturn]] void throwSqlError(sqlite3* db, int rc, const char* context)
{
    const QString message = QStringLiteral("%1: %2")
                                .arg(QLatin1String(context), QString::fromUtf8(sqlite3_errmsg(db)));
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        LOG_WARN(svIndex, "Manifest integrity violation: %s", qUtf8Printable(message));
        throw ManifestIntegrityError(message);
    }
    LOG_ERROR(svIndex, "Manifest storage error: %s", qUtf8Printable(message));
    throw ManifestError(message);
}

void execOrThrow(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        sqlite3_free(errMsg);
        throwSqlError(db, rc, sql);
    }
}

// Prepared statement owning its sqlite3_stmt.
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
        : m_db(db)
    {
        const int rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(m_stmt);
            m_stmt = nullptr;
            throwSqlError(db, rc, "prepare");
        }
    }

    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const QString& value)
    {
        const QByteArray utf8 = value.toUtf8();
        sqlite3_bind_text(m_stmt, index, utf8.constData(), static_cast<int>(utf8.size()),
                          SQLITE_TRANSIENT);
        return *this;
    }

    Statement& bind(int index, int64_t value)
    {
        sqlite3_bind_int64(m_stmt, index, value);
        return *this;
    }

    Statement& bind(int index, const std::optional<QString>& value)
    {
        if (value) {
            return bind(index, *value);
        }
        sqlite3_bind_null(m_stmt, index);
        return *this;
    }

    // True while rows are produced; false once done.
    bool step()
    {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throwSqlError(m_db, rc, sqlite3_sql(m_stmt));
    }

    void reset()
    {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

    QString text(int column) const
    {
        const auto* data = reinterpret_cast<const char*>(sqlite3_column_text(m_stmt, column));
        const int size = sqlite3_column_bytes(m_stmt, column);
        return data ? QString::fromUtf8(data, size) : QString();
    }

    int64_t int64(int column) const { return sqlite3_column_int64(m_stmt, column); }
    bool isNull(int column) const { return sqlite3_column_type(m_stmt, column) == SQLITE_NULL; }

    int changes() const { return sqlite3_changes(m_db); }

private:
    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_stmt = nullptr;
};

constexpr const char* kDocumentColumns =
    "doc_id, path, mime_type, scope, source_mtime, file_hash, metadata, ingested_at, status";

DocumentRow documentFromRow(const Statement& stmt)
{
    DocumentRow row;
    row.docId = stmt.text(0);
    row.path = stmt.text(1);
    row.mimeType = stmt.text(2);
    row.scope = stmt.text(3);
    row.sourceMtime = fromIso(stmt.text(4));
    row.fileHash = stmt.text(5);
    row.metadata = metadataFromText(stmt.text(6));
    row.ingestedAt = fromIso(stmt.text(7));
    row.status = documentStatusFromString(stmt.text(8));
    return row;
}

constexpr const char* kChunkColumns =
    "chunk_id, doc_id, chunk_index, offset_start, offset_end, chunk_hash, token_count, "
    "extractor, extractor_version, scope, chunk_text, created_at";

ChunkRow chunkFromRow(const Statement& stmt)
{
    ChunkRow row;
    row.chunkId = stmt.text(0);
    row.docId = stmt.text(1);
    row.chunkIndex = static_cast<int>(stmt.int64(2));
    row.offsetStart = stmt.int64(3);
    row.offsetEnd = stmt.int64(4);
    row.chunkHash = stmt.text(5);
    row.tokenCount = static_cast<int>(stmt.int64(6));
    row.extractor = stmt.text(7);
    row.extractorVersion = stmt.text(8);
    row.scope = stmt.text(9);
    row.text = stmt.text(10);
    row.createdAt = fromIso(stmt.text(11));
    return row;
}

constexpr const char* kChunkTextSelect =
    "SELECT c.chunk_id, c.doc_id, d.path, c.scope, c.chunk_text, c.chunk_index, d.metadata "
    "FROM chunks c JOIN documents d ON d.doc_id = c.doc_id ";

ChunkText chunkTextFromRow(const Statement& stmt)
{
    ChunkText row;
    row.chunkId = stmt.text(0);
    row.docId = stmt.text(1);
    row.path = stmt.text(2);
    row.scope = stmt.text(3);
    row.text = stmt.text(4);
    row.chunkIndex = static_cast<int>(stmt.int64(5));
    row.metadata = metadataFromText(stmt.text(6));
    row.riskLevel = riskFromMetadata(row.metadata);
    return row;
}

IngestJobRow jobFromRow(const Statement& stmt)
{
    IngestJobRow row;
    row.jobId = stmt.text(0);
    row.startedAt = fromIso(stmt.text(1));
    if (!stmt.isNull(2)) {
        row.completedAt = fromIso(stmt.text(2));
    }
    row.status = jobStatusFromString(stmt.text(3));
    row.docsProcessed = stmt.int64(4);
    row.chunksCreated = stmt.int64(5);
    row.embeddingsCreated = stmt.int64(6);
    if (!stmt.isNull(7)) {
        row.errorMessage = stmt.text(7);
    }
    return row;
}

void countGrouped(sqlite3* db, const char* sql, std::map<QString, int64_t>& out)
{
    Statement stmt(db, sql);
    while (stmt.step()) {
        out[stmt.text(0)] = stmt.int64(1);
    }
}

int64_t countScalar(sqlite3* db, const char* sql)
{
    Statement stmt(db, sql);
    return stmt.step() ? stmt.int64(0) : 0;
}

void insertDocumentRow(sqlite3* db, const QString& docId, const DocumentRef& doc)
{
    Statement stmt(db,
        "INSERT INTO documents (doc_id, path, mime_type, scope, source_mtime, file_hash, "
        "metadata, ingested_at, status) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
    stmt.bind(1, docId)
        .bind(2, doc.path)
        .bind(3, doc.mimeType)
        .bind(4, doc.scope)
        .bind(5, toIso(doc.sourceMtime))
        .bind(6, doc.fileHash)
        .bind(7, metadataToText(doc.metadata))
        .bind(8, nowIso())
        .bind(9, documentStatusToString(doc.status));
    stmt.step();
}

// chunkIds is parallel to chunks.
void insertChunkRows(sqlite3* db, const QString& docId, const QString& scope,
                     const std::vector<Chunk>& chunks, const std::vector<QString>& chunkIds,
                     const QString& extractor, const QString& extractorVersion)
{
    Statement insert(db,
        "INSERT INTO chunks (chunk_id, doc_id, chunk_index, offset_start, offset_end, "
        "chunk_hash, token_count, extractor, extractor_version, scope, chunk_text, created_at) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)");

    const QString createdAt = nowIso();
    int previousIndex = -1;

    for (size_t i = 0; i < chunks.size(); ++i) {
        const Chunk& chunk = chunks[i];
        if (chunk.chunkIndex <= previousIndex) {
            throw ManifestIntegrityError(
                QStringLiteral("chunk_index must be strictly increasing (got %1 after %2)")
                    .arg(chunk.chunkIndex)
                    .arg(previousIndex));
        }
        previousIndex = chunk.chunkIndex;

        insert.bind(1, chunkIds[i])
            .bind(2, docId)
            .bind(3, static_cast<int64_t>(chunk.chunkIndex))
            .bind(4, chunk.offsetStart)
            .bind(5, chunk.offsetEnd)
            .bind(6, chunk.chunkHash)
            .bind(7, static_cast<int64_t>(chunk.tokenCount))
            .bind(8, extractor)
            .bind(9, extractorVersion)
            .bind(10, scope)
            .bind(11, chunk.text)
            .bind(12, createdAt);
        insert.step();
        insert.reset();
    }
}

void insertEmbeddingRow(sqlite3* db, const QString& embeddingId, const QString& chunkId,
                        const QString& model, const QString& modelVersion,
                        const QString& vectorRef)
{
    Statement stmt(db,
        "INSERT INTO embeddings (embedding_id, chunk_id, embedding_model, "
        "embedding_model_version, embedded_at, vector_ref) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    stmt.bind(1, embeddingId)
        .bind(2, chunkId)
        .bind(3, model)
        .bind(4, modelVersion)
        .bind(5, nowIso())
        .bind(6, vectorRef);
    stmt.step();
}

} // anonymous namespace

RiskLevel DocumentRow::riskLevel() const
{
    return riskFromMetadata(metadata);
}

QJsonObject ManifestStatistics::toJson() const
{
    auto toObject = [](const std::map<QString, int64_t>& counts) {
        QJsonObject obj;
        for (const auto& [key, value] : counts) {
            obj[key] = static_cast<qint64>(value);
        }
        return obj;
    };

    QJsonObject json;
    json[QStringLiteral("total_documents")] = static_cast<qint64>(totalDocuments);
    json[QStringLiteral("total_chunks")] = static_cast<qint64>(totalChunks);
    json[QStringLiteral("total_embeddings")] = static_cast<qint64>(totalEmbeddings);
    json[QStringLiteral("total_ingest_jobs")] = static_cast<qint64>(totalIngestJobs);
    json[QStringLiteral("documents_by_status")] = toObject(documentsByStatus);
    json[QStringLiteral("documents_by_scope")] = toObject(documentsByScope);
    json[QStringLiteral("chunks_by_scope")] = toObject(chunksByScope);
    json[QStringLiteral("jobs_by_status")] = toObject(jobsByStatus);
    json[QStringLiteral("schema_version")] = schemaVersion;
    return json;
}

// ── Connections ─────────────────────────────────────────────

// One unit of database access: borrows the persistent connection (holding the
// store mutex) or opens a private connection for the duration of the call.
class ManifestStore::Session {
public:
    explicit Session(const ManifestStore& store)
    {
        if (store.m_persistentDb) {
            m_lock = std::unique_lock<std::mutex>(store.m_mutex);
            m_db = store.m_persistentDb;
        } else {
            m_db = openConnection(store.m_path);
            if (!m_db) {
                throw ManifestError(QStringLiteral("cannot open manifest at %1").arg(store.m_path));
            }
            m_owned = true;
        }
    }

    ~Session()
    {
        if (m_owned) {
            sqlite3_close(m_db);
        }
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    sqlite3* db() const { return m_db; }

private:
    std::unique_lock<std::mutex> m_lock;
    sqlite3* m_db = nullptr;
    bool m_owned = false;
};

sqlite3* ManifestStore::openConnection(const QString& path)
{
    sqlite3* db = nullptr;
    const QByteArray utf8Path = path.toUtf8();
    const int rc = sqlite3_open_v2(utf8Path.constData(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(svIndex, "Failed to open manifest %s: %s",
                  qUtf8Printable(path), db ? sqlite3_errmsg(db) : "out of memory");
        sqlite3_close(db);
        return nullptr;
    }

    sqlite3_busy_timeout(db, 30000);

    char* errMsg = nullptr;
    if (sqlite3_exec(db, kConnectionPragmas, nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_ERROR(svIndex, "Failed to set connection pragmas: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        sqlite3_close(db);
        return nullptr;
    }
    return db;
}

template <typename Fn>
auto ManifestStore::inTransaction(Fn&& fn)
{
    Session session(*this);
    sqlite3* db = session.db();
    execOrThrow(db, "BEGIN IMMEDIATE");
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn, sqlite3*>>) {
            fn(db);
            execOrThrow(db, "COMMIT");
        } else {
            auto result = fn(db);
            execOrThrow(db, "COMMIT");
            return result;
        }
    } catch (...) {
        sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

// ── Lifecycle ───────────────────────────────────────────────

ManifestStore::ManifestStore(QString path, sqlite3* persistentDb)
    : m_path(std::move(path))
    , m_persistentDb(persistentDb)
{
}

ManifestStore::~ManifestStore()
{
    if (m_persistentDb) {
        sqlite3_close(m_persistentDb);
    }
}

std::unique_ptr<ManifestStore> ManifestStore::open(const QString& dbPath)
{
    const bool inMemory = dbPath == QLatin1String(kInMemoryPath);

    if (!inMemory) {
        const QString parentDir = QFileInfo(dbPath).absolutePath();
        if (!QDir().mkpath(parentDir)) {
            LOG_ERROR(svIndex, "Failed to create manifest directory: %s", qUtf8Printable(parentDir));
            return nullptr;
        }
    }

    sqlite3* db = openConnection(dbPath);
    if (!db) {
        return nullptr;
    }

    if (!inMemory) {
        char* errMsg = nullptr;
        if (sqlite3_exec(db, kDatabasePragmas, nullptr, nullptr, &errMsg) != SQLITE_OK) {
            LOG_WARN(svIndex, "Database pragmas failed: %s", errMsg ? errMsg : "unknown");
            sqlite3_free(errMsg);
        }
    }

    if (!applyMigrations(db, kManifestSchemaVersion)) {
        LOG_ERROR(svIndex, "Manifest migration failed for %s", qUtf8Printable(dbPath));
        sqlite3_close(db);
        return nullptr;
    }

    LOG_INFO(svIndex, "Manifest opened: %s (schema v%d)",
             qUtf8Printable(dbPath), currentSchemaVersion(db));

    if (!inMemory) {
        sqlite3_close(db);
        db = nullptr;
    }
    return std::unique_ptr<ManifestStore>(new ManifestStore(dbPath, db));
}

int ManifestStore::schemaVersion() const
{
    Session session(*this);
    return currentSchemaVersion(session.db());
}

// ── Documents ───────────────────────────────────────────────

QString ManifestStore::addDocument(const DocumentRef& doc)
{
    const QString docId = newId();
    inTransaction([&](sqlite3* db) {
        insertDocumentRow(db, docId, doc);
    });
    LOG_DEBUG(svIndex, "Added document %s (%s)", qUtf8Printable(docId), qUtf8Printable(doc.path));
    return docId;
}

QString ManifestStore::newRowId()
{
    return newId();
}

void ManifestStore::commitDocument(const StagedDocument& staged,
                                   const std::optional<QString>& replacedDocId)
{
    if (staged.chunkIds.size() != staged.chunks.size()) {
        throw ManifestIntegrityError(
            QStringLiteral("staged document %1 has %2 chunk ids for %3 chunks")
                .arg(staged.docId)
                .arg(static_cast<int>(staged.chunkIds.size()))
                .arg(static_cast<int>(staged.chunks.size())));
    }

    inTransaction([&](sqlite3* db) {
        if (replacedDocId) {
            Statement remove(db, "DELETE FROM documents WHERE doc_id = ?1");
            remove.bind(1, *replacedDocId);
            remove.step();
        }

        insertDocumentRow(db, staged.docId, staged.doc);
        insertChunkRows(db, staged.docId, staged.doc.scope, staged.chunks, staged.chunkIds,
                        staged.extractor, staged.extractorVersion);

        if (!staged.embeddingModel.isEmpty()) {
            for (const QString& chunkId : staged.chunkIds) {
                insertEmbeddingRow(db, newId(), chunkId, staged.embeddingModel,
                                   staged.embeddingModelVersion, chunkId);
            }
        }
    });

    LOG_DEBUG(svIndex, "Committed document %s (%s): %d chunks, replaced=%s",
              qUtf8Printable(staged.docId), qUtf8Printable(staged.doc.path),
              static_cast<int>(staged.chunks.size()),
              qUtf8Printable(replacedDocId.value_or(QStringLiteral("none"))));
}

std::optional<DocumentRow> ManifestStore::getDocument(const QString& docId) const
{
    Session session(*this);
    const QByteArray sql = QByteArray("SELECT ") + kDocumentColumns
        + " FROM documents WHERE doc_id = ?1";
    Statement stmt(session.db(), sql.constData());
    stmt.bind(1, docId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return documentFromRow(stmt);
}

std::optional<DocumentRow> ManifestStore::getDocumentByPath(const QString& path) const
{
    Session session(*this);
    const QByteArray sql = QByteArray("SELECT ") + kDocumentColumns
        + " FROM documents WHERE path = ?1";
    Statement stmt(session.db(), sql.constData());
    stmt.bind(1, path);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return documentFromRow(stmt);
}

bool ManifestStore::updateDocumentStatus(const QString& docId, DocumentStatus status)
{
    return inTransaction([&](sqlite3* db) {
        Statement stmt(db, "UPDATE documents SET status = ?1 WHERE doc_id = ?2");
        stmt.bind(1, documentStatusToString(status)).bind(2, docId);
        stmt.step();
        return stmt.changes() > 0;
    });
}

bool ManifestStore::markStale(const QString& docId)
{
    return updateDocumentStatus(docId, DocumentStatus::Stale);
}

std::vector<DocumentRow> ManifestStore::listDocuments(const std::optional<QString>& scope,
                                                      const std::optional<DocumentStatus>& status) const
{
    Session session(*this);
    const QByteArray sql = QByteArray("SELECT ") + kDocumentColumns
        + " FROM documents WHERE (?1 IS NULL OR scope = ?1) AND (?2 IS NULL OR status = ?2)"
          " ORDER BY path";
    Statement stmt(session.db(), sql.constData());
    stmt.bind(1, scope);
    stmt.bind(2, status ? std::optional<QString>(documentStatusToString(*status)) : std::nullopt);

    std::vector<DocumentRow> rows;
    while (stmt.step()) {
        rows.push_back(documentFromRow(stmt));
    }
    return rows;
}

std::vector<DocumentRow> ManifestStore::getStaleDocuments(const std::optional<QString>& scope) const
{
    return listDocuments(scope, DocumentStatus::Stale);
}

bool ManifestStore::deleteDocument(const QString& docId)
{
    const bool deleted = inTransaction([&](sqlite3* db) {
        Statement stmt(db, "DELETE FROM documents WHERE doc_id = ?1");
        stmt.bind(1, docId);
        stmt.step();
        return stmt.changes() > 0;
    });
    if (deleted) {
        LOG_DEBUG(svIndex, "Deleted document %s with its chunks", qUtf8Printable(docId));
    }
    return deleted;
}

// ── Chunks ──────────────────────────────────────────────────

std::vector<QString> ManifestStore::addChunks(const QString& docId,
                                              const std::vector<Chunk>& chunks,
                                              const QString& extractor,
                                              const QString& extractorVersion)
{
    return inTransaction([&](sqlite3* db) {
        QString scope;
        {
            Statement lookup(db, "SELECT scope FROM documents WHERE doc_id = ?1");
            lookup.bind(1, docId);
            if (!lookup.step()) {
                throw ManifestIntegrityError(
                    QStringLiteral("cannot add chunks: unknown document %1").arg(docId));
            }
            scope = lookup.text(0);
        }

        std::vector<QString> ids;
        ids.reserve(chunks.size());
        for (size_t i = 0; i < chunks.size(); ++i) {
            ids.push_back(newId());
        }
        insertChunkRows(db, docId, scope, chunks, ids, extractor, extractorVersion);
        return ids;
    });
}

std::optional<ChunkRow> ManifestStore::getChunk(const QString& chunkId) const
{
    Session session(*this);
    const QByteArray sql = QByteArray("SELECT ") + kChunkColumns
        + " FROM chunks WHERE chunk_id = ?1";
    Statement stmt(session.db(), sql.constData());
    stmt.bind(1, chunkId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return chunkFromRow(stmt);
}

std::vector<ChunkRow> ManifestStore::getChunksForDocument(const QString& docId) const
{
    Session session(*this);
    const QByteArray sql = QByteArray("SELECT ") + kChunkColumns
        + " FROM chunks WHERE doc_id = ?1 ORDER BY chunk_index";
    Statement stmt(session.db(), sql.constData());
    stmt.bind(1, docId);

    std::vector<ChunkRow> rows;
    while (stmt.step()) {
        rows.push_back(chunkFromRow(stmt));
    }
    return rows;
}

int ManifestStore::deleteChunksForDocument(const QString& docId)
{
    return inTransaction([&](sqlite3* db) {
        Statement stmt(db, "DELETE FROM chunks WHERE doc_id = ?1");
        stmt.bind(1, docId);
        stmt.step();
        return stmt.changes();
    });
}

std::vector<ChunkText> ManifestStore::listChunkTexts(const QString& scope) const
{
    Session session(*this);
    const QByteArray sql = QByteArray(kChunkTextSelect)
        + "WHERE c.scope = ?1 AND d.status IN ('ingested', 'stale') "
          "ORDER BY d.path, c.chunk_index";
    Statement stmt(session.db(), sql.constData());
    stmt.bind(1, scope);

    std::vector<ChunkText> rows;
    while (stmt.step()) {
        rows.push_back(chunkTextFromRow(stmt));
    }
    return rows;
}

std::optional<ChunkText> ManifestStore::getChunkText(const QString& chunkId) const
{
    Session session(*this);
    const QByteArray sql = QByteArray(kChunkTextSelect) + "WHERE c.chunk_id = ?1";
    Statement stmt(session.db(), sql.constData());
    stmt.bind(1, chunkId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return chunkTextFromRow(stmt);
}

// ── Embeddings ──────────────────────────────────────────────

QString ManifestStore::addEmbedding(const QString& chunkId,
                                    const QString& model,
                                    const QString& modelVersion,
                                    const QString& vectorRef)
{
    const QString embeddingId = newId();
    inTransaction([&](sqlite3* db) {
        insertEmbeddingRow(db, embeddingId, chunkId, model, modelVersion, vectorRef);
    });
    return embeddingId;
}

bool ManifestStore::hasEmbedding(const QString& chunkId, const QString& model,
                                 const QString& modelVersion) const
{
    Session session(*this);
    Statement stmt(session.db(),
        "SELECT 1 FROM embeddings WHERE chunk_id = ?1 AND embedding_model = ?2 "
        "AND embedding_model_version = ?3 LIMIT 1");
    stmt.bind(1, chunkId).bind(2, model).bind(3, modelVersion);
    return stmt.step();
}

std::vector<EmbeddingRow> ManifestStore::getEmbeddingsForChunk(const QString& chunkId) const
{
    Session session(*this);
    Statement stmt(session.db(),
        "SELECT embedding_id, chunk_id, embedding_model, embedding_model_version, "
        "embedded_at, vector_ref FROM embeddings WHERE chunk_id = ?1 ORDER BY embedded_at");
    stmt.bind(1, chunkId);

    std::vector<EmbeddingRow> rows;
    while (stmt.step()) {
        EmbeddingRow row;
        row.embeddingId = stmt.text(0);
        row.chunkId = stmt.text(1);
        row.model = stmt.text(2);
        row.modelVersion = stmt.text(3);
        row.embeddedAt = fromIso(stmt.text(4));
        row.vectorRef = stmt.text(5);
        rows.push_back(std::move(row));
    }
    return rows;
}

int64_t ManifestStore::countEmbeddingsForDocument(const QString& docId) const
{
    Session session(*this);
    Statement stmt(session.db(),
        "SELECT COUNT(*) FROM embeddings e JOIN chunks c ON c.chunk_id = e.chunk_id "
        "WHERE c.doc_id = ?1");
    stmt.bind(1, docId);
    return stmt.step() ? stmt.int64(0) : 0;
}

// ── Ingest jobs ─────────────────────────────────────────────

QString ManifestStore::startIngestJob()
{
    const QString jobId = newId();
    inTransaction([&](sqlite3* db) {
        Statement stmt(db,
            "INSERT INTO ingest_jobs (job_id, started_at, status) VALUES (?1, ?2, 'running')");
        stmt.bind(1, jobId).bind(2, nowIso());
        stmt.step();
    });
    LOG_INFO(svIndex, "Ingest job %s started", qUtf8Printable(jobId));
    return jobId;
}

bool ManifestStore::updateIngestJob(const QString& jobId, int64_t docsProcessed,
                                    int64_t chunksCreated, int64_t embeddingsCreated)
{
    return inTransaction([&](sqlite3* db) {
        Statement current(db,
            "SELECT status, docs_processed, chunks_created, embeddings_created "
            "FROM ingest_jobs WHERE job_id = ?1");
        current.bind(1, jobId);
        if (!current.step()) {
            LOG_WARN(svIndex, "updateIngestJob: unknown job %s", qUtf8Printable(jobId));
            return false;
        }
        if (jobStatusFromString(current.text(0)) != JobStatus::Running) {
            LOG_WARN(svIndex, "updateIngestJob: job %s is not running", qUtf8Printable(jobId));
            return false;
        }
        if (docsProcessed < current.int64(1) || chunksCreated < current.int64(2)
            || embeddingsCreated < current.int64(3)) {
            LOG_WARN(svIndex, "updateIngestJob: refusing to decrease counters of job %s",
                     qUtf8Printable(jobId));
            return false;
        }

        Statement update(db,
            "UPDATE ingest_jobs SET docs_processed = ?1, chunks_created = ?2, "
            "embeddings_created = ?3 WHERE job_id = ?4");
        update.bind(1, docsProcessed)
            .bind(2, chunksCreated)
            .bind(3, embeddingsCreated)
            .bind(4, jobId);
        update.step();
        return true;
    });
}

bool ManifestStore::completeIngestJob(const QString& jobId, JobStatus status,
                                      const std::optional<QString>& errorMessage)
{
    if (status == JobStatus::Running) {
        LOG_WARN(svIndex, "completeIngestJob: running is not a terminal status");
        return false;
    }

    const bool completed = inTransaction([&](sqlite3* db) {
        Statement stmt(db,
            "UPDATE ingest_jobs SET status = ?1, completed_at = ?2, error_message = ?3 "
            "WHERE job_id = ?4 AND status = 'running'");
        stmt.bind(1, jobStatusToString(status))
            .bind(2, nowIso())
            .bind(3, errorMessage)
            .bind(4, jobId);
        stmt.step();
        return stmt.changes() > 0;
    });
    if (completed) {
        LOG_INFO(svIndex, "Ingest job %s finished: %s",
                 qUtf8Printable(jobId), qUtf8Printable(jobStatusToString(status)));
    }
    return completed;
}

std::optional<IngestJobRow> ManifestStore::getIngestJob(const QString& jobId) const
{
    Session session(*this);
    Statement stmt(session.db(),
        "SELECT job_id, started_at, completed_at, status, docs_processed, chunks_created, "
        "embeddings_created, error_message FROM ingest_jobs WHERE job_id = ?1");
    stmt.bind(1, jobId);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return jobFromRow(stmt);
}

// ── Maintenance ─────────────────────────────────────────────

ManifestStatistics ManifestStore::statistics() const
{
    Session session(*this);
    sqlite3* db = session.db();

    ManifestStatistics stats;
    stats.totalDocuments = countScalar(db, "SELECT COUNT(*) FROM documents");
    stats.totalChunks = countScalar(db, "SELECT COUNT(*) FROM chunks");
    stats.totalEmbeddings = countScalar(db, "SELECT COUNT(*) FROM embeddings");
    stats.totalIngestJobs = countScalar(db, "SELECT COUNT(*) FROM ingest_jobs");
    countGrouped(db, "SELECT status, COUNT(*) FROM documents GROUP BY status",
                 stats.documentsByStatus);
    countGrouped(db, "SELECT scope, COUNT(*) FROM documents GROUP BY scope",
                 stats.documentsByScope);
    countGrouped(db, "SELECT scope, COUNT(*) FROM chunks GROUP BY scope",
                 stats.chunksByScope);
    countGrouped(db, "SELECT status, COUNT(*) FROM ingest_jobs GROUP BY status",
                 stats.jobsByStatus);
    stats.schemaVersion = currentSchemaVersion(db);
    return stats;
}

bool ManifestStore::vacuum()
{
    Session session(*this);
    char* errMsg = nullptr;
    if (sqlite3_exec(session.db(), "VACUUM", nullptr, nullptr, &errMsg) != SQLITE_OK) {
        LOG_ERROR(svIndex, "VACUUM failed: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

} // namespace sv
