#pragma once

#include <QString>
#include <cstdint>

namespace sv {

// A contiguous, token-bounded slice of a document's extracted text.
struct Chunk {
    int chunkIndex = 0;
    QString text;
    int64_t offsetStart = 0; // UTF-8 byte offset into the extracted text
    int64_t offsetEnd = 0;
    QString chunkHash;
    int tokenCount = 0;
};

// SHA-256 hex digest of the UTF-8 chunk text. Pure function of content.
QString computeChunkHash(const QString& text);

} // namespace sv
