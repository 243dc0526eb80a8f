#pragma once

#include "core/shared/types.h"
#include "core/vector/vector_index_client.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace sv {

struct VectorIndexConfig {
    int dimensions = 0; // 0 adopts the size of the first vector written
    QString collection = QStringLiteral("sieve_chunks");
    QString snapshotDir;
    int initialCapacity = 1024;
};

// HnswVectorIndex: in-process VectorIndexClient over an hnswlib graph.
//
// Vectors are L2-normalized on the way in, so inner-product distance d gives
// cosine similarity 1 - d. Payloads live beside the graph keyed by label.
// Snapshots write the graph (.hnsw) and a JSON sidecar with ids and payloads
// into snapshotDir.
class HnswVectorIndex : public VectorIndexClient {
public:
    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;

    explicit HnswVectorIndex(const VectorIndexConfig& config = {});
    ~HnswVectorIndex() override;

    HnswVectorIndex(const HnswVectorIndex&) = delete;
    HnswVectorIndex& operator=(const HnswVectorIndex&) = delete;

    bool upsert(const QString& id, const std::vector<float>& vector,
                const QJsonObject& payload) override;
    int upsertBatch(const std::vector<VectorPoint>& points, int batchSize = 100) override;

    std::vector<VectorHit> search(const std::vector<float>& vector,
                                  const QString& scope,
                                  int topK,
                                  const QJsonObject& filters = {},
                                  std::optional<double> scoreThreshold = std::nullopt) override;

    bool remove(const QString& id) override;
    int removeByDoc(const QString& docId) override;
    int64_t count(const QJsonObject& filters = {}) const override;

    std::optional<QString> snapshot() override;
    std::vector<SnapshotInfo> listSnapshots() const override;
    bool restore(const QString& name) override;

    HealthStatus healthCheck() const override;

    int dimensions() const;

private:
    struct Entry {
        uint64_t label = 0;
        QJsonObject payload;
    };

    bool createIndexLocked(int dimensions, size_t capacity);
    bool ensureCapacityForOneMoreLocked();
    bool upsertLocked(const QString& id, const std::vector<float>& vector,
                      const QJsonObject& payload);
    bool removeLocked(const QString& id);

    VectorIndexConfig m_config;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    std::unordered_map<QString, Entry, QStringHash> m_entries;
    std::unordered_map<uint64_t, QString> m_idsByLabel;
    uint64_t m_nextLabel = 0;
    mutable std::mutex m_mutex;
};

// Returns the L2-normalized copy of vector (unchanged if its norm is zero).
std::vector<float> normalizeVector(std::vector<float> vector);

} // namespace sv
