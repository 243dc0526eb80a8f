#include "core/extraction/text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFile>
#include <QStringConverter>

namespace sv {

namespace {

// 50 MB - files beyond this are too large for full-text indexing
constexpr qint64 kMaxFileSizeBytes = 50 * 1024 * 1024;

} // anonymous namespace

QStringList TextExtractor::mimeTypes() const
{
    return {
        QStringLiteral("text/plain"),
        QStringLiteral("text/markdown"),
        QStringLiteral("text/x-markdown"),
        QStringLiteral("text/csv"),
        QStringLiteral("text/html"),
        QStringLiteral("text/xml"),
        QStringLiteral("application/json"),
        QStringLiteral("application/xml"),
        QStringLiteral("application/x-yaml"),
    };
}

ExtractionResult TextExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    if (auto failed = checkSourceFile(filePath, kMaxFileSizeBytes)) {
        failed->durationMs = static_cast<int>(timer.elapsed());
        return *failed;
    }

    ExtractionResult result;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("Failed to open file: %1").arg(file.errorString());
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    const QByteArray rawBytes = file.readAll();
    file.close();

    QString decoded;
    {
        auto toUtf8 = QStringDecoder(QStringDecoder::Utf8,
                                     QStringDecoder::Flag::Stateless);
        decoded = toUtf8(rawBytes);

        if (toUtf8.hasError()) {
            decoded = QString::fromLatin1(rawBytes);
            LOG_DEBUG(svExtraction, "UTF-8 decode failed for %s, using Latin-1 fallback",
                      qUtf8Printable(filePath));
        }
    }

    result.status = ExtractionResult::Status::Success;
    result.content = std::move(decoded);
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(svExtraction, "Extracted %lld chars from %s in %d ms",
              static_cast<long long>(result.content->size()),
              qUtf8Printable(filePath),
              result.durationMs);

    return result;
}

} // namespace sv
