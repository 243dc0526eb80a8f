#include "core/vector/hnsw_vector_index.h"
#include "core/shared/errors.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

#include <algorithm>
#include <cmath>
#include <functional>

namespace sv {

namespace {

constexpr int kSnapshotVersion = 1;

class CallbackFilter : public hnswlib::BaseFilterFunctor {
public:
    explicit CallbackFilter(std::function<bool(hnswlib::labeltype)> accept)
        : m_accept(std::move(accept))
    {
    }

    bool operator()(hnswlib::labeltype label) override { return m_accept(label); }

private:
    std::function<bool(hnswlib::labeltype)> m_accept;
};

} // anonymous namespace

std::vector<float> normalizeVector(std::vector<float> vector)
{
    double sumSquares = 0.0;
    for (float v : vector) {
        sumSquares += static_cast<double>(v) * static_cast<double>(v);
    }
    if (sumSquares <= 0.0) {
        return vector;
    }
    const float invNorm = static_cast<float>(1.0 / std::sqrt(sumSquares));
    for (float& v : vector) {
        v *= invNorm;
    }
    return vector;
}

HnswVectorIndex::HnswVectorIndex(const VectorIndexConfig& config)
    : m_config(config)
{
    if (m_config.initialCapacity < 1) {
        m_config.initialCapacity = 1;
    }
    if (m_config.dimensions > 0) {
        std::lock_guard<std::mutex> lock(m_mutex);
        createIndexLocked(m_config.dimensions, static_cast<size_t>(m_config.initialCapacity));
    }
}

HnswVectorIndex::~HnswVectorIndex() = default;

int HnswVectorIndex::dimensions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config.dimensions;
}

// ── Writes ──────────────────────────────────────────────────

bool HnswVectorIndex::upsert(const QString& id, const std::vector<float>& vector,
                             const QJsonObject& payload)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return upsertLocked(id, vector, payload);
}

int HnswVectorIndex::upsertBatch(const std::vector<VectorPoint>& points, int batchSize)
{
    const size_t step = static_cast<size_t>(std::max(1, batchSize));
    int written = 0;
    for (size_t begin = 0; begin < points.size(); begin += step) {
        const size_t end = std::min(begin + step, points.size());
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = begin; i < end; ++i) {
            if (upsertLocked(points[i].id, points[i].vector, points[i].payload)) {
                ++written;
            }
        }
    }
    if (written != static_cast<int>(points.size())) {
        LOG_WARN(svVector, "upsertBatch wrote %d of %d points",
                 written, static_cast<int>(points.size()));
    }
    return written;
}

bool HnswVectorIndex::upsertLocked(const QString& id, const std::vector<float>& vector,
                                   const QJsonObject& payload)
{
    if (id.isEmpty() || vector.empty()) {
        LOG_WARN(svVector, "upsert rejected: empty id or vector");
        return false;
    }

    if (!m_index) {
        if (m_config.dimensions <= 0) {
            m_config.dimensions = static_cast<int>(vector.size());
        }
        if (!createIndexLocked(m_config.dimensions,
                               static_cast<size_t>(m_config.initialCapacity))) {
            return false;
        }
    }

    if (static_cast<int>(vector.size()) != m_config.dimensions) {
        LOG_WARN(svVector, "upsert %s rejected: dimension %d, index expects %d",
                 qUtf8Printable(id), static_cast<int>(vector.size()), m_config.dimensions);
        return false;
    }

    const std::vector<float> normalized = normalizeVector(vector);

    auto existing = m_entries.find(id);
    uint64_t label = 0;
    if (existing != m_entries.end()) {
        label = existing->second.label;
    } else {
        if (!ensureCapacityForOneMoreLocked()) {
            return false;
        }
        label = m_nextLabel;
    }

    try {
        m_index->addPoint(normalized.data(), static_cast<hnswlib::labeltype>(label));
    } catch (const std::exception& e) {
        LOG_ERROR(svVector, "addPoint failed for %s: %s", qUtf8Printable(id), e.what());
        return false;
    }

    if (existing != m_entries.end()) {
        existing->second.payload = payload;
    } else {
        m_entries.emplace(id, Entry{label, payload});
        m_idsByLabel.emplace(label, id);
        ++m_nextLabel;
    }
    return true;
}

bool HnswVectorIndex::remove(const QString& id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return removeLocked(id);
}

int HnswVectorIndex::removeByDoc(const QString& docId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<QString> ids;
    for (const auto& [id, entry] : m_entries) {
        if (entry.payload.value(QStringLiteral("doc_id")).toString() == docId) {
            ids.push_back(id);
        }
    }

    int removed = 0;
    for (const QString& id : ids) {
        if (removeLocked(id)) {
            ++removed;
        }
    }
    LOG_DEBUG(svVector, "Removed %d points of document %s", removed, qUtf8Printable(docId));
    return removed;
}

bool HnswVectorIndex::removeLocked(const QString& id)
{
    auto it = m_entries.find(id);
    if (it == m_entries.end() || !m_index) {
        return false;
    }

    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(it->second.label));
    } catch (const std::exception& e) {
        LOG_ERROR(svVector, "markDelete failed for %s: %s", qUtf8Printable(id), e.what());
        return false;
    }

    m_idsByLabel.erase(it->second.label);
    m_entries.erase(it);
    return true;
}

// ── Reads ───────────────────────────────────────────────────

std::vector<VectorHit> HnswVectorIndex::search(const std::vector<float>& vector,
                                               const QString& scope,
                                               int topK,
                                               const QJsonObject& filters,
                                               std::optional<double> scoreThreshold)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (topK <= 0 || !m_index || m_entries.empty()) {
        return {};
    }
    if (static_cast<int>(vector.size()) != m_config.dimensions) {
        throw VectorIndexError(QStringLiteral("query dimension %1 does not match index dimension %2")
                                   .arg(vector.size())
                                   .arg(m_config.dimensions));
    }

    const std::vector<float> query = normalizeVector(vector);
    const size_t k = std::min(static_cast<size_t>(topK), m_entries.size());

    CallbackFilter filter([this, &scope, &filters](hnswlib::labeltype label) {
        auto idIt = m_idsByLabel.find(static_cast<uint64_t>(label));
        if (idIt == m_idsByLabel.end()) {
            return false;
        }
        auto entryIt = m_entries.find(idIt->second);
        return entryIt != m_entries.end() && payloadMatches(entryIt->second.payload, scope, filters);
    });

    std::vector<VectorHit> hits;
    try {
        m_index->setEf(std::max(static_cast<size_t>(kEfSearch), k));
        auto queue = m_index->searchKnn(query.data(), k, &filter);
        hits.reserve(queue.size());
        while (!queue.empty()) {
            const auto [distance, label] = queue.top();
            queue.pop();

            auto idIt = m_idsByLabel.find(static_cast<uint64_t>(label));
            if (idIt == m_idsByLabel.end()) {
                continue;
            }
            const double score = 1.0 - static_cast<double>(distance);
            if (scoreThreshold && score < *scoreThreshold) {
                continue;
            }
            hits.push_back(VectorHit{idIt->second, score, m_entries.at(idIt->second).payload});
        }
    } catch (const std::exception& e) {
        throw VectorIndexError(QStringLiteral("hnsw search failed: %1")
                                   .arg(QString::fromUtf8(e.what())));
    }

    std::sort(hits.begin(), hits.end(), [](const VectorHit& a, const VectorHit& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.id < b.id;
    });
    return hits;
}

int64_t HnswVectorIndex::count(const QJsonObject& filters) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (filters.isEmpty()) {
        return static_cast<int64_t>(m_entries.size());
    }
    return std::count_if(m_entries.begin(), m_entries.end(), [&filters](const auto& item) {
        return payloadMatches(item.second.payload, QString(), filters);
    });
}

HealthStatus HnswVectorIndex::healthCheck() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        if (m_config.dimensions <= 0) {
            return {true, QStringLiteral("hnsw index empty, dimension not yet fixed")};
        }
        return {false, QStringLiteral("hnsw index failed to initialize")};
    }
    return {true, QStringLiteral("hnsw index ok: %1 points, dimension %2, capacity %3")
                      .arg(m_entries.size())
                      .arg(m_config.dimensions)
                      .arg(m_index->getMaxElements())};
}

// ── Snapshots ───────────────────────────────────────────────

std::optional<QString> HnswVectorIndex::snapshot()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_config.snapshotDir.isEmpty()) {
        LOG_WARN(svVector, "snapshot skipped: no snapshot directory configured");
        return std::nullopt;
    }
    if (!m_index) {
        LOG_WARN(svVector, "snapshot skipped: index is empty");
        return std::nullopt;
    }
    if (!QDir().mkpath(m_config.snapshotDir)) {
        LOG_ERROR(svVector, "Failed to create snapshot directory: %s",
                  qUtf8Printable(m_config.snapshotDir));
        return std::nullopt;
    }

    const QDateTime createdAt = QDateTime::currentDateTimeUtc();
    const QString name = QStringLiteral("%1-%2").arg(
        m_config.collection, createdAt.toString(QStringLiteral("yyyyMMddTHHmmsszzz")));
    const QDir dir(m_config.snapshotDir);

    try {
        m_index->saveIndex(dir.filePath(name + QStringLiteral(".hnsw")).toStdString());
    } catch (const std::exception& e) {
        LOG_ERROR(svVector, "snapshot failed to persist graph: %s", e.what());
        return std::nullopt;
    }

    QJsonArray points;
    for (const auto& [id, entry] : m_entries) {
        QJsonObject point;
        point[QStringLiteral("id")] = id;
        point[QStringLiteral("label")] = static_cast<qint64>(entry.label);
        point[QStringLiteral("payload")] = entry.payload;
        points.append(point);
    }

    QJsonObject meta;
    meta[QStringLiteral("version")] = kSnapshotVersion;
    meta[QStringLiteral("collection")] = m_config.collection;
    meta[QStringLiteral("dimensions")] = m_config.dimensions;
    meta[QStringLiteral("next_label")] = static_cast<qint64>(m_nextLabel);
    meta[QStringLiteral("m")] = kM;
    meta[QStringLiteral("ef_construction")] = kEfConstruction;
    meta[QStringLiteral("created_at")] = createdAt.toString(Qt::ISODateWithMs);
    meta[QStringLiteral("points")] = points;

    QFile metaFile(dir.filePath(name + QStringLiteral(".json")));
    if (!metaFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(svVector, "snapshot failed to open %s", qUtf8Printable(metaFile.fileName()));
        return std::nullopt;
    }
    const qint64 written = metaFile.write(QJsonDocument(meta).toJson(QJsonDocument::Compact));
    metaFile.close();
    if (written < 0) {
        LOG_ERROR(svVector, "snapshot failed writing %s", qUtf8Printable(metaFile.fileName()));
        return std::nullopt;
    }

    LOG_INFO(svVector, "Snapshot %s written (%lld points)",
             qUtf8Printable(name), static_cast<long long>(m_entries.size()));
    return name;
}

std::vector<SnapshotInfo> HnswVectorIndex::listSnapshots() const
{
    QString snapshotDir;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshotDir = m_config.snapshotDir;
    }

    std::vector<SnapshotInfo> snapshots;
    if (snapshotDir.isEmpty()) {
        return snapshots;
    }

    const QDir dir(snapshotDir);
    const QFileInfoList metas = dir.entryInfoList({QStringLiteral("*.json")}, QDir::Files,
                                                  QDir::Name);
    for (const QFileInfo& meta : metas) {
        const QFileInfo graph(dir.filePath(meta.completeBaseName() + QStringLiteral(".hnsw")));
        if (!graph.exists()) {
            continue;
        }
        SnapshotInfo info;
        info.name = meta.completeBaseName();
        info.createdAt = meta.lastModified().toUTC();
        info.sizeBytes = meta.size() + graph.size();
        snapshots.push_back(info);
    }
    return snapshots;
}

bool HnswVectorIndex::restore(const QString& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QDir dir(m_config.snapshotDir);
    const QString graphPath = dir.filePath(name + QStringLiteral(".hnsw"));
    QFile metaFile(dir.filePath(name + QStringLiteral(".json")));

    if (m_config.snapshotDir.isEmpty() || !QFileInfo::exists(graphPath)
        || !metaFile.open(QIODevice::ReadOnly)) {
        LOG_ERROR(svVector, "restore: snapshot %s not found", qUtf8Printable(name));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument metaDoc = QJsonDocument::fromJson(metaFile.readAll(), &parseError);
    metaFile.close();
    if (parseError.error != QJsonParseError::NoError || !metaDoc.isObject()) {
        LOG_ERROR(svVector, "restore: invalid snapshot metadata: %s",
                  qUtf8Printable(parseError.errorString()));
        return false;
    }

    const QJsonObject meta = metaDoc.object();
    const int dimensions = meta.value(QStringLiteral("dimensions")).toInt(-1);
    if (dimensions <= 0) {
        LOG_ERROR(svVector, "restore: snapshot %s has no dimension", qUtf8Printable(name));
        return false;
    }
    if (m_config.dimensions > 0 && dimensions != m_config.dimensions) {
        LOG_ERROR(svVector, "restore: dimension mismatch %d vs %d", dimensions, m_config.dimensions);
        return false;
    }

    const QJsonArray points = meta.value(QStringLiteral("points")).toArray();
    const uint64_t nextLabel = meta.value(QStringLiteral("next_label")).toVariant().toULongLong();
    const size_t capacity = std::max({static_cast<size_t>(m_config.initialCapacity),
                                      static_cast<size_t>(nextLabel + 1),
                                      static_cast<size_t>(points.size()) * 2});

    auto space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dimensions));
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index;
    try {
        index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            space.get(), graphPath.toStdString(), false, capacity);
    } catch (const std::exception& e) {
        LOG_ERROR(svVector, "restore: failed to load graph: %s", e.what());
        return false;
    }

    std::unordered_map<QString, Entry, QStringHash> entries;
    std::unordered_map<uint64_t, QString> idsByLabel;
    for (const QJsonValue& value : points) {
        const QJsonObject point = value.toObject();
        const QString id = point.value(QStringLiteral("id")).toString();
        const uint64_t label = point.value(QStringLiteral("label")).toVariant().toULongLong();
        entries.emplace(id, Entry{label, point.value(QStringLiteral("payload")).toObject()});
        idsByLabel.emplace(label, id);
    }

    m_space = std::move(space);
    m_index = std::move(index);
    m_index->setEf(static_cast<size_t>(kEfSearch));
    m_entries = std::move(entries);
    m_idsByLabel = std::move(idsByLabel);
    m_nextLabel = nextLabel;
    m_config.dimensions = dimensions;

    LOG_INFO(svVector, "Restored snapshot %s (%lld points)",
             qUtf8Printable(name), static_cast<long long>(m_entries.size()));
    return true;
}

// ── Internals ───────────────────────────────────────────────

bool HnswVectorIndex::createIndexLocked(int dimensions, size_t capacity)
{
    if (dimensions <= 0) {
        LOG_ERROR(svVector, "hnsw index requires a positive dimension");
        return false;
    }

    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dimensions));
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            std::max<size_t>(capacity, 1),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_config.dimensions = dimensions;
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(svVector, "hnsw index creation failed: %s", e.what());
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool HnswVectorIndex::ensureCapacityForOneMoreLocked()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold && current < maxElements) {
        return true;
    }

    const size_t newCapacity = std::max<size_t>(maxElements * 2, current + 1);
    try {
        m_index->resizeIndex(newCapacity);
        LOG_DEBUG(svVector, "hnsw index resized to capacity %llu",
                  static_cast<unsigned long long>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(svVector, "hnsw index resize failed: %s", e.what());
        return false;
    }
}

} // namespace sv
