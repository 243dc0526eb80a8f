#include "core/extraction/extractor.h"
#include "core/shared/logging.h"

#include <QFileInfo>

namespace sv {

QString extractionStatusToString(ExtractionResult::Status status)
{
    switch (status) {
    case ExtractionResult::Status::Success:           return QStringLiteral("success");
    case ExtractionResult::Status::CorruptedFile:     return QStringLiteral("corrupted_file");
    case ExtractionResult::Status::UnsupportedFormat: return QStringLiteral("unsupported_format");
    case ExtractionResult::Status::SizeExceeded:      return QStringLiteral("size_exceeded");
    case ExtractionResult::Status::Inaccessible:      return QStringLiteral("inaccessible");
    case ExtractionResult::Status::Unknown:           return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

std::optional<ExtractionResult> checkSourceFile(const QString& filePath,
                                                qint64 maxFileSizeBytes)
{
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        ExtractionResult result;
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File does not exist or is not a regular file");
        return result;
    }

    if (!info.isReadable()) {
        ExtractionResult result;
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File is not readable");
        return result;
    }

    if (maxFileSizeBytes > 0 && info.size() > maxFileSizeBytes) {
        ExtractionResult result;
        result.status = ExtractionResult::Status::SizeExceeded;
        result.errorMessage = QStringLiteral("File size %1 bytes exceeds limit of %2 bytes")
                                  .arg(info.size())
                                  .arg(maxFileSizeBytes);
        LOG_INFO(svExtraction, "Skipping oversized file: %s (%lld bytes)",
                 qUtf8Printable(filePath), static_cast<long long>(info.size()));
        return result;
    }

    return std::nullopt;
}

} // namespace sv
