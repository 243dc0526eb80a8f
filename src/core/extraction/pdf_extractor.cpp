#include "core/extraction/pdf_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QStringList>

#include <algorithm>
#include <memory>

#if defined(SV_POPPLER_QT6)
#include <poppler/qt6/poppler-qt6.h>
#elif defined(SV_POPPLER_CPP)
#include <poppler-document.h>
#include <poppler-page.h>
#endif

namespace sv {

namespace {

constexpr qint64 kMaxFileSizeBytes = 200LL * 1024 * 1024;

} // anonymous namespace

ExtractionResult PdfExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    if (auto failed = checkSourceFile(filePath, kMaxFileSizeBytes)) {
        failed->durationMs = static_cast<int>(timer.elapsed());
        return *failed;
    }

    ExtractionResult result;

#if defined(SV_POPPLER_QT6) || defined(SV_POPPLER_CPP)
    constexpr int kMaxPages = 1000;

#if defined(SV_POPPLER_QT6)
    std::unique_ptr<Poppler::Document> doc(Poppler::Document::load(filePath));
#elif defined(SV_POPPLER_CPP)
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(filePath.toStdString()));
#endif
    if (!doc) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("Failed to load PDF document");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_WARN(svExtraction, "Poppler failed to load: %s", qUtf8Printable(filePath));
        return result;
    }

#if defined(SV_POPPLER_QT6)
    if (doc->isLocked()) {
#elif defined(SV_POPPLER_CPP)
    if (doc->is_locked()) {
#endif
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("PDF is encrypted or password-protected");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_INFO(svExtraction, "Skipping encrypted PDF: %s", qUtf8Printable(filePath));
        return result;
    }

    const int pageCount =
#if defined(SV_POPPLER_QT6)
        doc->numPages();
#elif defined(SV_POPPLER_CPP)
        doc->pages();
#endif
    const int pagesToProcess = std::min(pageCount, kMaxPages);

    if (pageCount > kMaxPages) {
        LOG_INFO(svExtraction, "PDF has %d pages, capping at %d: %s",
                 pageCount, kMaxPages, qUtf8Printable(filePath));
    }

    QStringList pages;
    for (int i = 0; i < pagesToProcess; ++i) {
#if defined(SV_POPPLER_QT6)
        std::unique_ptr<Poppler::Page> page(doc->page(i));
#elif defined(SV_POPPLER_CPP)
        std::unique_ptr<poppler::page> page(doc->create_page(i));
#endif
        if (!page) {
            LOG_DEBUG(svExtraction, "Null page %d in %s", i, qUtf8Printable(filePath));
            continue;
        }

#if defined(SV_POPPLER_QT6)
        const QString pageText = page->text(QRectF());
#elif defined(SV_POPPLER_CPP)
        const poppler::byte_array utf8Page = page->text().to_utf8();
        const QString pageText = QString::fromUtf8(utf8Page.data(),
                                                   static_cast<int>(utf8Page.size()));
#endif
        if (pageText.trimmed().isEmpty()) {
            continue;
        }
        pages.append(QStringLiteral("[Page %1]\n%2").arg(i + 1).arg(pageText));
    }

    result.status = ExtractionResult::Status::Success;
    result.content = pages.join(QStringLiteral("\n\n"));
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(svExtraction, "Extracted %d pages from PDF %s in %d ms",
              pagesToProcess, qUtf8Printable(filePath), result.durationMs);

    return result;

#else
    result.status = ExtractionResult::Status::UnsupportedFormat;
    result.errorMessage = QStringLiteral("PDF extraction unavailable (Poppler not found)");
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_INFO(svExtraction, "PDF extraction skipped (no Poppler): %s",
             qUtf8Printable(filePath));
    return result;
#endif
}

} // namespace sv
