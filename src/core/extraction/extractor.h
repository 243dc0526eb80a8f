#pragma once

#include <QString>
#include <QStringList>
#include <optional>

namespace sv {

// Result of a content extraction attempt.
// Every extraction produces a status; content is present only on Success.
struct ExtractionResult {
    enum class Status {
        Success,
        CorruptedFile,
        UnsupportedFormat,
        SizeExceeded,
        Inaccessible,
        Unknown,
    };

    Status status = Status::Unknown;
    std::optional<QString> content;
    std::optional<QString> errorMessage;
    int durationMs = 0;

    bool ok() const { return status == Status::Success && content.has_value(); }
};

QString extractionStatusToString(ExtractionResult::Status status);

// Extractor: converts one family of source formats into UTF-8 text.
//
// name() and version() are recorded with every chunk so a re-extraction with
// a different backend can be audited.
class Extractor {
public:
    virtual ~Extractor() = default;

    virtual QString name() const = 0;
    virtual QString version() const = 0;

    // MIME types this extractor is registered for by default.
    virtual QStringList mimeTypes() const = 0;

    virtual ExtractionResult extract(const QString& filePath) = 0;

    bool supports(const QString& mimeType) const
    {
        return mimeTypes().contains(mimeType, Qt::CaseInsensitive);
    }
};

// Shared pre-flight check: existence, readability and size cap.
// Returns a failed result when the file cannot be extracted at all.
std::optional<ExtractionResult> checkSourceFile(const QString& filePath,
                                                qint64 maxFileSizeBytes);

} // namespace sv
