#include "core/indexing/chunk_tokenizer.h"

namespace sv {

namespace {

constexpr qsizetype kMaxWordChars = 16;

bool isWordChar(QChar c)
{
    return c.isLetterOrNumber() || c.isMark() || c == QLatin1Char('_');
}

} // anonymous namespace

std::vector<TokenSpan> ChunkTokenizer::encode(QStringView text)
{
    std::vector<TokenSpan> tokens;
    const qsizetype n = text.size();
    qsizetype i = 0;

    while (i < n) {
        const qsizetype start = i;
        const QChar c = text[i];

        if (c == QLatin1Char(' ') && i + 1 < n && !text[i + 1].isSpace()) {
            ++i; // single space prefixes the following token
        } else if (c.isSpace()) {
            qsizetype j = i;
            while (j < n && text[j].isSpace()) {
                ++j;
            }
            // Leave the last space of the run to prefix the next token.
            if (j < n && j - i > 1 && text[j - 1] == QLatin1Char(' ')) {
                --j;
            }
            tokens.push_back({start, j - start});
            i = j;
            continue;
        }

        qsizetype j = i;
        if (isWordChar(text[i])) {
            while (j < n && isWordChar(text[j]) && j - i < kMaxWordChars) {
                ++j;
            }
        } else {
            while (j < n && !isWordChar(text[j]) && !text[j].isSpace()) {
                ++j;
            }
        }
        tokens.push_back({start, j - start});
        i = j;
    }

    return tokens;
}

int ChunkTokenizer::countTokens(QStringView text)
{
    return static_cast<int>(encode(text).size());
}

QString ChunkTokenizer::decode(QStringView text, const std::vector<TokenSpan>& tokens,
                               size_t first, size_t last)
{
    if (first >= last || first >= tokens.size()) {
        return QString();
    }
    if (last > tokens.size()) {
        last = tokens.size();
    }
    const qsizetype begin = tokens[first].start;
    const qsizetype end = tokens[last - 1].end();
    return text.mid(begin, end - begin).toString();
}

} // namespace sv
