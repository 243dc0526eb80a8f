#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <vector>

namespace sv {

// Configuration for the Chunker. All sizes are in tokens.
struct ChunkerConfig {
    int targetTokens = 512;
    int overlapTokens = 50;
    int minTokens = 100;
    int maxTokens = 2000;
};

// Chunker: splits extracted text into token-bounded, overlapping chunks.
//
// 1. Structural split: markdown headings (levels 1-3) for markdown input,
//    paragraph breaks (\n\n+) otherwise.
// 2. A section within targetTokens becomes one chunk; a longer one is cut
//    by a window of targetTokens advancing by targetTokens - overlapTokens.
// 3. A chunk below minTokens is merged into the chunk that follows it.
// 4. chunkIndex is assigned in document order and chunkHash is computed over
//    the final text.
//
// Offsets are UTF-8 byte offsets into the input text.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    // Empty or whitespace-only text yields no chunks.
    std::vector<Chunk> chunk(const QString& text,
                             const QString& mimeType = QStringLiteral("text/plain")) const;

    // Expected chunk count for text treated as a single section.
    int estimateChunkCount(const QString& text) const;

    const Config& config() const { return m_config; }

    static bool isMarkdown(const QString& mimeType);

private:
    struct Section {
        qsizetype start = 0;
        qsizetype length = 0;
    };

    std::vector<Section> splitSections(const QString& text, bool markdown) const;

    Config m_config;
};

} // namespace sv
