#pragma once

#include "core/extraction/extractor.h"

namespace sv {

// PdfExtractor: extracts text from PDF files using Poppler.
//
// Each non-empty page becomes a "[Page N]" block; blocks are separated by a
// blank line so the chunker sees page boundaries as paragraph breaks.
// Without Poppler, returns UnsupportedFormat.
//
// Limits:
//   - 1000-page cap per document
//   - Encrypted PDFs are rejected (CorruptedFile status)
class PdfExtractor : public Extractor {
public:
    QString name() const override { return QStringLiteral("pdf-poppler"); }
    QString version() const override { return QStringLiteral("1.0"); }
    QStringList mimeTypes() const override { return {QStringLiteral("application/pdf")}; }

    ExtractionResult extract(const QString& filePath) override;
};

} // namespace sv
