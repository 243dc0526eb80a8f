#include "core/indexing/chunker.h"
#include "core/indexing/chunk_tokenizer.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>
#include <optional>

namespace sv {

namespace {

struct Piece {
    QString text;
    int64_t offsetStart = 0;
    int64_t offsetEnd = 0;
    int tokenCount = 0;
};

int64_t utf8Length(QStringView text)
{
    return static_cast<int64_t>(text.toUtf8().size());
}

// Tracks the UTF-8 byte offset of increasing character positions without
// re-encoding the whole prefix each time.
class ByteOffsetCursor {
public:
    explicit ByteOffsetCursor(QStringView text)
        : m_text(text)
    {
    }

    int64_t at(qsizetype pos)
    {
        if (pos < m_pos) {
            m_pos = 0;
            m_bytes = 0;
        }
        m_bytes += utf8Length(m_text.mid(m_pos, pos - m_pos));
        m_pos = pos;
        return m_bytes;
    }

private:
    QStringView m_text;
    qsizetype m_pos = 0;
    int64_t m_bytes = 0;
};

} // anonymous namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    if (m_config.maxTokens < 1) {
        m_config.maxTokens = 1;
    }
    if (m_config.targetTokens < 1) {
        m_config.targetTokens = 1;
    }
    if (m_config.targetTokens > m_config.maxTokens) {
        m_config.targetTokens = m_config.maxTokens;
    }
    if (m_config.minTokens > m_config.targetTokens) {
        m_config.minTokens = m_config.targetTokens;
    }
    if (m_config.minTokens < 0) {
        m_config.minTokens = 0;
    }
    // The window must always advance by at least one token.
    m_config.overlapTokens = std::clamp(m_config.overlapTokens, 0, m_config.targetTokens - 1);
}

bool Chunker::isMarkdown(const QString& mimeType)
{
    return mimeType.compare(QLatin1String("text/markdown"), Qt::CaseInsensitive) == 0
        || mimeType.compare(QLatin1String("text/x-markdown"), Qt::CaseInsensitive) == 0;
}

// ── Public API ──────────────────────────────────────────────

std::vector<Chunk> Chunker::chunk(const QString& text, const QString& mimeType) const
{
    std::vector<Chunk> chunks;
    if (text.trimmed().isEmpty()) {
        return chunks;
    }

    const std::vector<Section> sections = splitSections(text, isMarkdown(mimeType));
    const size_t target = static_cast<size_t>(m_config.targetTokens);
    const size_t step = static_cast<size_t>(m_config.targetTokens - m_config.overlapTokens);

    // Piece starts and piece ends each increase monotonically.
    ByteOffsetCursor startCursor(text);
    ByteOffsetCursor endCursor(text);
    std::vector<Piece> pieces;

    for (const Section& section : sections) {
        const QStringView sectionText = QStringView(text).mid(section.start, section.length);
        const std::vector<TokenSpan> tokens = ChunkTokenizer::encode(sectionText);
        if (tokens.empty()) {
            continue;
        }

        if (tokens.size() <= target) {
            Piece piece;
            piece.text = sectionText.toString();
            piece.offsetStart = startCursor.at(section.start);
            piece.offsetEnd = endCursor.at(section.start + section.length);
            piece.tokenCount = static_cast<int>(tokens.size());
            pieces.push_back(std::move(piece));
            continue;
        }

        for (size_t first = 0; first < tokens.size(); first += step) {
            const size_t last = std::min(first + target, tokens.size());
            Piece piece;
            piece.text = ChunkTokenizer::decode(sectionText, tokens, first, last);
            piece.offsetStart = startCursor.at(section.start + tokens[first].start);
            piece.offsetEnd = endCursor.at(section.start + tokens[last - 1].end());
            piece.tokenCount = static_cast<int>(last - first);
            pieces.push_back(std::move(piece));
            if (last == tokens.size()) {
                break;
            }
        }
    }

    // Merge undersized pieces forward into their successor.
    std::vector<Piece> merged;
    merged.reserve(pieces.size());
    std::optional<Piece> pending;
    for (size_t i = 0; i < pieces.size(); ++i) {
        Piece piece = std::move(pieces[i]);
        if (pending) {
            piece.text = pending->text + QStringLiteral("\n\n") + piece.text;
            piece.offsetStart = pending->offsetStart;
            piece.tokenCount = ChunkTokenizer::countTokens(piece.text);
            pending.reset();
        }
        if (piece.tokenCount < m_config.minTokens && i + 1 < pieces.size()) {
            pending = std::move(piece);
            continue;
        }
        merged.push_back(std::move(piece));
    }

    chunks.reserve(merged.size());
    for (size_t i = 0; i < merged.size(); ++i) {
        Chunk c;
        c.chunkIndex = static_cast<int>(i);
        c.text = std::move(merged[i].text);
        c.offsetStart = merged[i].offsetStart;
        c.offsetEnd = merged[i].offsetEnd;
        c.tokenCount = merged[i].tokenCount;
        c.chunkHash = computeChunkHash(c.text);
        chunks.push_back(std::move(c));
    }

    LOG_DEBUG(svIngest, "Chunked %lld chars into %d chunks (%d sections)",
              static_cast<long long>(text.size()),
              static_cast<int>(chunks.size()),
              static_cast<int>(sections.size()));

    return chunks;
}

int Chunker::estimateChunkCount(const QString& text) const
{
    const int tokens = ChunkTokenizer::countTokens(text);
    if (text.trimmed().isEmpty() || tokens == 0) {
        return 0;
    }
    if (tokens <= m_config.targetTokens) {
        return 1;
    }
    const int step = m_config.targetTokens - m_config.overlapTokens;
    const int remaining = tokens - m_config.targetTokens;
    return 1 + (remaining + step - 1) / step;
}

// ── Private helpers ─────────────────────────────────────────

std::vector<Chunker::Section> Chunker::splitSections(const QString& text, bool markdown) const
{
    // Boundaries are [start, end) slices of text before trimming.
    std::vector<std::pair<qsizetype, qsizetype>> raw;

    if (markdown) {
        static const QRegularExpression heading(
            QStringLiteral("^#{1,3}\\s"), QRegularExpression::MultilineOption);
        std::vector<qsizetype> starts{0};
        auto it = heading.globalMatch(text);
        while (it.hasNext()) {
            const qsizetype pos = it.next().capturedStart();
            if (pos > 0) {
                starts.push_back(pos);
            }
        }
        for (size_t i = 0; i < starts.size(); ++i) {
            const qsizetype end = (i + 1 < starts.size()) ? starts[i + 1] : text.size();
            raw.emplace_back(starts[i], end);
        }
    } else {
        static const QRegularExpression paragraphBreak(QStringLiteral("\\n\\n+"));
        qsizetype start = 0;
        auto it = paragraphBreak.globalMatch(text);
        while (it.hasNext()) {
            const QRegularExpressionMatch m = it.next();
            raw.emplace_back(start, m.capturedStart());
            start = m.capturedEnd();
        }
        raw.emplace_back(start, text.size());
    }

    std::vector<Section> sections;
    sections.reserve(raw.size());
    for (auto [start, end] : raw) {
        while (start < end && text[start].isSpace()) {
            ++start;
        }
        while (end > start && text[end - 1].isSpace()) {
            --end;
        }
        if (end > start) {
            sections.push_back({start, end - start});
        }
    }
    return sections;
}

} // namespace sv
