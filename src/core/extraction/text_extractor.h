#pragma once

#include "core/extraction/extractor.h"

namespace sv {

// TextExtractor: reads plain text, markdown and text-like data formats.
//
// Attempts UTF-8 decoding first, falling back to Latin-1 so that every byte
// sequence decodes to something.
class TextExtractor : public Extractor {
public:
    QString name() const override { return QStringLiteral("text-direct"); }
    QString version() const override { return QStringLiteral("1.0"); }
    QStringList mimeTypes() const override;

    ExtractionResult extract(const QString& filePath) override;
};

} // namespace sv
