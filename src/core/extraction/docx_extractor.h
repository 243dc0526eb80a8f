#pragma once

#include "core/extraction/extractor.h"

namespace sv {

// DocxExtractor: reads the paragraph text of Office Open XML documents
// through duckx. Paragraphs are joined by a blank line; empty paragraphs are
// dropped. Paragraphs styled as headings become markdown headings so the
// chunker can split on them. Without duckx, returns UnsupportedFormat.
class DocxExtractor : public Extractor {
public:
    QString name() const override { return QStringLiteral("docx-duckx"); }
    QString version() const override { return QStringLiteral("1.0"); }
    QStringList mimeTypes() const override;

    ExtractionResult extract(const QString& filePath) override;

    // Heading level for a paragraph style id ("Heading2" -> 2, "Heading" -> 1,
    // capped at 6), or 0 for body text.
    static int headingLevel(const QString& styleId);
    static QString formatParagraph(const QString& text, const QString& styleId);
};

} // namespace sv
