#pragma once

#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sv {

struct Bm25Config {
    double k1 = 1.5;
    double b = 0.75;
};

struct Bm25Document {
    QString chunkId;
    QString text;
};

struct Bm25Hit {
    QString chunkId;
    double score = 0.0;
};

// Bm25Index - in-memory Okapi BM25 over chunk text.
//
//   IDF(t)   = ln((N - df(t) + 0.5) / (df(t) + 0.5) + 1)
//   score(D) = sum over query tokens t of
//              IDF(t) * tf(t,D) * (k1 + 1) / (tf(t,D) + k1 * (1 - b + b * |D| / avgdl))
//
// Postings, document frequencies and the total length are maintained
// incrementally, so update() and remove() cost O(vocabulary of that chunk).
// IDF is derived from the live counts at query time, which makes a
// remove()/update() pair restore identical scores.
//
// Not thread-safe; the owner serializes access.
class Bm25Index {
public:
    using Config = Bm25Config;

    explicit Bm25Index(const Config& config = {});

    // Lowercase, runs of [a-z0-9_], single-character tokens dropped except
    // "a" and "i". Query tokens repeat as often as they occur.
    static std::vector<QString> tokenize(const QString& text);

    // Replaces the whole index.
    void build(const std::vector<Bm25Document>& documents);

    // Adds or replaces one chunk.
    void update(const QString& chunkId, const QString& text);

    // Returns false if the chunk was not indexed.
    bool remove(const QString& chunkId);

    // Hits sorted by score descending (ties by chunk id). Empty for an empty
    // query or an index that was never built.
    std::vector<Bm25Hit> search(const QString& query, int topK = 30) const;

    double idf(const QString& term) const;
    double averageDocumentLength() const;

    struct Stats {
        int64_t documentCount = 0;
        int64_t vocabularySize = 0;
        double averageDocumentLength = 0.0;
    };
    Stats stats() const;

    void clear();
    bool isBuilt() const { return m_built; }
    size_t size() const { return m_docLengths.size(); }

private:
    using TermFreqs = std::unordered_map<QString, int, QStringHash>;

    void addDocument(const QString& chunkId, const QString& text);

    Config m_config;
    // term -> (chunk id -> term frequency)
    std::unordered_map<QString, TermFreqs, QStringHash> m_postings;
    // chunk id -> distinct terms of that chunk
    std::unordered_map<QString, std::vector<QString>, QStringHash> m_docTerms;
    std::unordered_map<QString, int, QStringHash> m_docLengths;
    int64_t m_totalLength = 0;
    bool m_built = false;
};

} // namespace sv
