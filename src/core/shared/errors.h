#pragma once

#include <QString>

#include <stdexcept>

namespace sv {

// Base of every error the retrieval core raises across a component boundary.
class SieveError : public std::runtime_error {
public:
    explicit SieveError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }

    QString message() const { return QString::fromUtf8(what()); }
};

// Source file is missing, unreadable, corrupt or of an unregistered type.
class ExtractionError : public SieveError {
public:
    ExtractionError(const QString& path, const QString& message)
        : SieveError(QStringLiteral("%1: %2").arg(path, message))
        , m_path(path)
    {
    }

    const QString& path() const { return m_path; }

private:
    QString m_path;
};

// Raised by the embedding adapter once its retry policy gives up, or at once
// for a request the provider rejected as malformed.
class EmbeddingError : public SieveError {
public:
    EmbeddingError(const QString& message, bool retryable, int httpStatus = 0)
        : SieveError(message)
        , m_retryable(retryable)
        , m_httpStatus(httpStatus)
    {
    }

    bool retryable() const { return m_retryable; }
    int httpStatus() const { return m_httpStatus; }

private:
    bool m_retryable;
    int m_httpStatus;
};

class VectorIndexError : public SieveError {
public:
    using SieveError::SieveError;
};

// Storage failure inside the manifest (I/O, SQL error, failed migration).
class ManifestError : public SieveError {
public:
    using SieveError::SieveError;
};

// Uniqueness or foreign-key violation. Always surfaced to the caller.
class ManifestIntegrityError : public ManifestError {
public:
    using ManifestError::ManifestError;
};

class ExplainerValidationError : public SieveError {
public:
    using SieveError::SieveError;
};

class LlmCallError : public SieveError {
public:
    using SieveError::SieveError;
};

} // namespace sv
