#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace sv {

struct VectorPoint {
    QString id;
    std::vector<float> vector;
    QJsonObject payload;
};

struct VectorHit {
    QString id;
    double score = 0.0; // similarity, higher is closer
    QJsonObject payload;
};

struct SnapshotInfo {
    QString name;
    QDateTime createdAt;
    int64_t sizeBytes = 0;
};

struct HealthStatus {
    bool healthy = false;
    QString message;
};

// VectorIndexClient: adapter over a vector-similarity engine.
//
// Points carry a JSON payload; search is restricted to points whose
// payload "scope" equals the requested scope and whose payload matches every
// key of filters (a filter value that is an array matches any of its
// elements). Connectivity failures during search raise VectorIndexError;
// writes report failure through their return values.
class VectorIndexClient {
public:
    virtual ~VectorIndexClient() = default;

    virtual bool upsert(const QString& id, const std::vector<float>& vector,
                        const QJsonObject& payload) = 0;

    // Returns the number of points written.
    virtual int upsertBatch(const std::vector<VectorPoint>& points, int batchSize = 100) = 0;

    virtual std::vector<VectorHit> search(const std::vector<float>& vector,
                                          const QString& scope,
                                          int topK,
                                          const QJsonObject& filters = {},
                                          std::optional<double> scoreThreshold = std::nullopt) = 0;

    virtual bool remove(const QString& id) = 0;

    // Removes every point whose payload doc_id equals docId; returns the count.
    virtual int removeByDoc(const QString& docId) = 0;

    virtual int64_t count(const QJsonObject& filters = {}) const = 0;

    // Returns the snapshot name, or nullopt if the snapshot failed.
    virtual std::optional<QString> snapshot() = 0;
    virtual std::vector<SnapshotInfo> listSnapshots() const = 0;
    virtual bool restore(const QString& name) = 0;

    virtual HealthStatus healthCheck() const = 0;
};

// True when payload satisfies scope (ignored when empty) and every filter key.
bool payloadMatches(const QJsonObject& payload, const QString& scope, const QJsonObject& filters);

} // namespace sv
