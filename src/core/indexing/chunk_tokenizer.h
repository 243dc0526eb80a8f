#pragma once

#include <QString>
#include <QStringView>
#include <vector>

namespace sv {

// A token as a slice of the encoded text (UTF-16 code unit positions).
struct TokenSpan {
    qsizetype start = 0;
    qsizetype length = 0;

    qsizetype end() const { return start + length; }
};

// ChunkTokenizer: deterministic BPE-style pre-tokenizer used for chunk sizing.
//
// Token classes:
//   - word: run of letters, digits, marks or '_' (at most 16 chars), with an
//     optional single leading space
//   - punctuation: run of other non-space chars, with an optional leading space
//   - whitespace: any other whitespace run
//
// Tokens tile the input exactly: concatenating every span reproduces the
// text, so decoding a token range is a plain substring.
class ChunkTokenizer {
public:
    static std::vector<TokenSpan> encode(QStringView text);
    static int countTokens(QStringView text);

    // Source text covered by tokens [first, last).
    static QString decode(QStringView text, const std::vector<TokenSpan>& tokens,
                          size_t first, size_t last);
};

} // namespace sv
