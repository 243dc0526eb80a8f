#pragma once

#include "core/extraction/extractor.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <memory>
#include <mutex>
#include <unordered_map>

namespace sv {

// Text produced by a registry extraction, tagged with the backend that
// produced it so chunks can record provenance.
struct ExtractedText {
    QString text;
    QString extractor;
    QString extractorVersion;
};

// ExtractorRegistry: routes a file to the extractor registered for its MIME
// type.
//
// Usage:
//   auto registry = ExtractorRegistry::withDefaults();
//   ExtractedText t = registry->extract("/docs/a.md", "text/markdown");
//
// Thread safety: registration and extraction may be called concurrently.
// Individual extractors are expected to be stateless.
class ExtractorRegistry {
public:
    ExtractorRegistry() = default;

    ExtractorRegistry(const ExtractorRegistry&) = delete;
    ExtractorRegistry& operator=(const ExtractorRegistry&) = delete;

    // Registry with the text, PDF and DOCX extractors installed.
    static std::unique_ptr<ExtractorRegistry> withDefaults();

    // Registers the extractor for every MIME type it reports. A later
    // registration for the same MIME type replaces the earlier one.
    void registerExtractor(std::shared_ptr<Extractor> extractor);

    // Registers the extractor for one extra MIME type.
    void registerExtractor(const QString& mimeType, std::shared_ptr<Extractor> extractor);

    std::shared_ptr<Extractor> extractorFor(const QString& mimeType) const;
    QStringList supportedMimeTypes() const;

    // Throws ExtractionError when no extractor is registered for mimeType or
    // when the extractor fails.
    ExtractedText extract(const QString& filePath, const QString& mimeType) const;

    // Best-effort MIME type from the file name (extension based).
    static QString mimeTypeForPath(const QString& filePath);

private:
    mutable std::mutex m_mutex;
    std::unordered_map<QString, std::shared_ptr<Extractor>, QStringHash> m_byMime;
};

} // namespace sv
