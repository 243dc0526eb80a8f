#include "core/index/bm25_index.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>
#include <cmath>

namespace sv {

Bm25Index::Bm25Index(const Config& config)
    : m_config(config)
{
}

std::vector<QString> Bm25Index::tokenize(const QString& text)
{
    static const QRegularExpression tokenRe(QStringLiteral("[a-z0-9_]+"));

    std::vector<QString> tokens;
    const QString lowered = text.toLower();
    auto it = tokenRe.globalMatch(lowered);
    while (it.hasNext()) {
        QString token = it.next().captured(0);
        if (token.size() > 1 || token == QLatin1String("a") || token == QLatin1String("i")) {
            tokens.push_back(std::move(token));
        }
    }
    return tokens;
}

// ── Building ────────────────────────────────────────────────

void Bm25Index::build(const std::vector<Bm25Document>& documents)
{
    clear();
    for (const Bm25Document& doc : documents) {
        addDocument(doc.chunkId, doc.text);
    }
    m_built = true;

    LOG_DEBUG(svRetrieval, "BM25 index built: %lld docs, %lld terms, avgdl=%.2f",
              static_cast<long long>(m_docLengths.size()),
              static_cast<long long>(m_postings.size()),
              averageDocumentLength());
}

void Bm25Index::update(const QString& chunkId, const QString& text)
{
    remove(chunkId);
    addDocument(chunkId, text);
    m_built = true;
}

bool Bm25Index::remove(const QString& chunkId)
{
    auto docIt = m_docTerms.find(chunkId);
    if (docIt == m_docTerms.end()) {
        return false;
    }

    for (const QString& term : docIt->second) {
        auto postingIt = m_postings.find(term);
        if (postingIt == m_postings.end()) {
            continue;
        }
        postingIt->second.erase(chunkId);
        if (postingIt->second.empty()) {
            m_postings.erase(postingIt);
        }
    }

    m_totalLength -= m_docLengths[chunkId];
    m_docLengths.erase(chunkId);
    m_docTerms.erase(docIt);
    return true;
}

void Bm25Index::addDocument(const QString& chunkId, const QString& text)
{
    const std::vector<QString> tokens = tokenize(text);
    if (tokens.empty()) {
        return;
    }

    TermFreqs freqs;
    for (const QString& token : tokens) {
        ++freqs[token];
    }

    std::vector<QString> terms;
    terms.reserve(freqs.size());
    for (const auto& [term, tf] : freqs) {
        m_postings[term][chunkId] = tf;
        terms.push_back(term);
    }

    m_docTerms[chunkId] = std::move(terms);
    m_docLengths[chunkId] = static_cast<int>(tokens.size());
    m_totalLength += static_cast<int64_t>(tokens.size());
}

void Bm25Index::clear()
{
    m_postings.clear();
    m_docTerms.clear();
    m_docLengths.clear();
    m_totalLength = 0;
    m_built = false;
}

// ── Scoring ─────────────────────────────────────────────────

double Bm25Index::averageDocumentLength() const
{
    if (m_docLengths.empty()) {
        return 0.0;
    }
    return static_cast<double>(m_totalLength) / static_cast<double>(m_docLengths.size());
}

double Bm25Index::idf(const QString& term) const
{
    auto it = m_postings.find(term);
    if (it == m_postings.end()) {
        return 0.0;
    }
    const double n = static_cast<double>(m_docLengths.size());
    const double df = static_cast<double>(it->second.size());
    return std::log((n - df + 0.5) / (df + 0.5) + 1.0);
}

std::vector<Bm25Hit> Bm25Index::search(const QString& query, int topK) const
{
    if (!m_built || m_docLengths.empty() || topK <= 0) {
        return {};
    }

    const std::vector<QString> queryTokens = tokenize(query);
    if (queryTokens.empty()) {
        return {};
    }

    const double avgdl = averageDocumentLength();
    const double k1 = m_config.k1;
    const double b = m_config.b;

    std::unordered_map<QString, double, QStringHash> scores;
    for (const QString& term : queryTokens) {
        auto postingIt = m_postings.find(term);
        if (postingIt == m_postings.end()) {
            continue;
        }
        const double termIdf = idf(term);
        for (const auto& [chunkId, tf] : postingIt->second) {
            const double docLength = static_cast<double>(m_docLengths.at(chunkId));
            const double freq = static_cast<double>(tf);
            const double norm = k1 * (1.0 - b + b * docLength / avgdl);
            scores[chunkId] += termIdf * freq * (k1 + 1.0) / (freq + norm);
        }
    }

    std::vector<Bm25Hit> hits;
    hits.reserve(scores.size());
    for (const auto& [chunkId, score] : scores) {
        if (score > 0.0) {
            hits.push_back({chunkId, score});
        }
    }

    std::sort(hits.begin(), hits.end(), [](const Bm25Hit& a, const Bm25Hit& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.chunkId < b.chunkId;
    });

    if (hits.size() > static_cast<size_t>(topK)) {
        hits.resize(static_cast<size_t>(topK));
    }
    return hits;
}

Bm25Index::Stats Bm25Index::stats() const
{
    Stats s;
    s.documentCount = static_cast<int64_t>(m_docLengths.size());
    s.vocabularySize = static_cast<int64_t>(m_postings.size());
    s.averageDocumentLength = averageDocumentLength();
    return s;
}

} // namespace sv
