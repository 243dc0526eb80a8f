#include "core/extraction/extractor_registry.h"
#include "core/extraction/docx_extractor.h"
#include "core/extraction/pdf_extractor.h"
#include "core/extraction/text_extractor.h"
#include "core/shared/errors.h"
#include "core/shared/logging.h"

#include <QMimeDatabase>

#include <algorithm>

namespace sv {

std::unique_ptr<ExtractorRegistry> ExtractorRegistry::withDefaults()
{
    auto registry = std::make_unique<ExtractorRegistry>();
    registry->registerExtractor(std::make_shared<TextExtractor>());
    registry->registerExtractor(std::make_shared<PdfExtractor>());
    registry->registerExtractor(std::make_shared<DocxExtractor>());
    return registry;
}

void ExtractorRegistry::registerExtractor(std::shared_ptr<Extractor> extractor)
{
    if (!extractor) {
        return;
    }
    const QStringList mimes = extractor->mimeTypes();
    for (const QString& mime : mimes) {
        registerExtractor(mime, extractor);
    }
}

void ExtractorRegistry::registerExtractor(const QString& mimeType,
                                          std::shared_ptr<Extractor> extractor)
{
    if (!extractor || mimeType.isEmpty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_byMime[mimeType.toLower()] = std::move(extractor);
}

std::shared_ptr<Extractor> ExtractorRegistry::extractorFor(const QString& mimeType) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_byMime.find(mimeType.toLower());
    if (it == m_byMime.end()) {
        return nullptr;
    }
    return it->second;
}

QStringList ExtractorRegistry::supportedMimeTypes() const
{
    QStringList mimes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        mimes.reserve(static_cast<qsizetype>(m_byMime.size()));
        for (const auto& [mime, extractor] : m_byMime) {
            mimes.append(mime);
        }
    }
    std::sort(mimes.begin(), mimes.end());
    return mimes;
}

ExtractedText ExtractorRegistry::extract(const QString& filePath, const QString& mimeType) const
{
    std::shared_ptr<Extractor> extractor = extractorFor(mimeType);
    if (!extractor) {
        throw ExtractionError(filePath,
                              QStringLiteral("no extractor registered for MIME type '%1'")
                                  .arg(mimeType));
    }

    const ExtractionResult result = extractor->extract(filePath);
    if (!result.ok()) {
        const QString reason = result.errorMessage.value_or(
            extractionStatusToString(result.status));
        LOG_WARN(svExtraction, "%s failed on %s: %s",
                 qUtf8Printable(extractor->name()), qUtf8Printable(filePath),
                 qUtf8Printable(reason));
        throw ExtractionError(filePath, reason);
    }

    return ExtractedText{*result.content, extractor->name(), extractor->version()};
}

QString ExtractorRegistry::mimeTypeForPath(const QString& filePath)
{
    static const QMimeDatabase db;
    const QString suffix = filePath.section(QLatin1Char('.'), -1).toLower();
    if (suffix == QLatin1String("md") || suffix == QLatin1String("markdown")) {
        return QStringLiteral("text/markdown");
    }
    return db.mimeTypeForFile(filePath, QMimeDatabase::MatchExtension).name();
}

} // namespace sv
