#include "core/extraction/docx_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#if defined(SV_HAVE_DUCKX)
#include <duckx/duckx.hpp>
#endif

#include <exception>
#include <string>

namespace sv {

namespace {

constexpr qint64 kMaxFileSizeBytes = 100LL * 1024 * 1024;
constexpr int kMaxHeadingLevel = 6;

} // anonymous namespace

QStringList DocxExtractor::mimeTypes() const
{
    return {
        QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.document"),
        QStringLiteral("application/msword"),
    };
}

int DocxExtractor::headingLevel(const QString& styleId)
{
    static const QString kHeading = QStringLiteral("Heading");
    const QString style = styleId.trimmed();
    if (!style.startsWith(kHeading, Qt::CaseInsensitive)) {
        return 0;
    }
    const QChar last = style.back();
    const int level = last.isDigit() ? last.digitValue() : 1;
    return qBound(1, level, kMaxHeadingLevel);
}

QString DocxExtractor::formatParagraph(const QString& text, const QString& styleId)
{
    const int level = headingLevel(styleId);
    if (level == 0) {
        return text;
    }
    return QString(level, QLatin1Char('#')) + QLatin1Char(' ') + text.trimmed();
}

ExtractionResult DocxExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    if (auto failed = checkSourceFile(filePath, kMaxFileSizeBytes)) {
        failed->durationMs = static_cast<int>(timer.elapsed());
        return *failed;
    }

    ExtractionResult result;

#if defined(SV_HAVE_DUCKX)
    try {
        duckx::Document doc(filePath.toStdString());
        doc.open();
        if (!doc.is_open()) {
            result.status = ExtractionResult::Status::CorruptedFile;
            result.errorMessage = QStringLiteral("Failed to open DOCX archive");
            result.durationMs = static_cast<int>(timer.elapsed());
            LOG_WARN(svExtraction, "duckx failed to open: %s", qUtf8Printable(filePath));
            return result;
        }

        QStringList paragraphs;
        for (auto p = doc.paragraphs(); p.has_next(); p.next()) {
            std::string paragraph;
            QString styleId;
            for (auto r = p.runs(); r.has_next(); r.next()) {
                const auto& run = r.get_node();
                if (styleId.isEmpty()) {
                    // <w:p><w:pPr><w:pStyle w:val="Heading1"/></w:pPr><w:r>...
                    styleId = QString::fromUtf8(run.parent().child("w:pPr").child("w:pStyle")
                                                    .attribute("w:val").value());
                }
                for (auto node = run.first_child(); node; node = node.next_sibling()) {
                    const std::string nodeName = node.name();
                    if (nodeName == "w:t") {
                        paragraph += node.text().get();
                    } else if (nodeName == "w:br") {
                        paragraph += '\n';
                    } else if (nodeName == "w:tab") {
                        paragraph += '\t';
                    }
                }
            }
            const QString text = QString::fromStdString(paragraph);
            if (!text.trimmed().isEmpty()) {
                paragraphs.append(formatParagraph(text, styleId));
            }
        }

        result.status = ExtractionResult::Status::Success;
        result.content = paragraphs.join(QStringLiteral("\n\n"));
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_DEBUG(svExtraction, "Extracted %lld paragraphs from DOCX %s in %d ms",
                  static_cast<long long>(paragraphs.size()), qUtf8Printable(filePath),
                  result.durationMs);
        return result;
    } catch (const std::exception& e) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("DOCX parse failed: %1").arg(QString::fromUtf8(e.what()));
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_WARN(svExtraction, "DOCX parse failed for %s: %s",
                 qUtf8Printable(filePath), e.what());
        return result;
    }
#else
    result.status = ExtractionResult::Status::UnsupportedFormat;
    result.errorMessage = QStringLiteral("DOCX extraction unavailable (duckx not found)");
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_INFO(svExtraction, "DOCX extraction skipped (no duckx): %s",
             qUtf8Printable(filePath));
    return result;
#endif
}

} // namespace sv
