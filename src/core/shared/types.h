#pragma once

#include <QHash>
#include <QString>

namespace sv {

// Lifecycle of a manifest document.
enum class DocumentStatus {
    Pending,
    Ingested,
    Failed,
    Stale,
};

QString documentStatusToString(DocumentStatus status);
DocumentStatus documentStatusFromString(const QString& str);

enum class JobStatus {
    Running,
    Completed,
    Failed,
};

QString jobStatusToString(JobStatus status);
JobStatus jobStatusFromString(const QString& str);

// Governance mode is owned by an external collaborator; the retrieval core
// only reads it to rerank.
enum class GovernanceMode {
    ReadOnly,
    Permission,
    Bypass,
};

QString governanceModeToString(GovernanceMode mode);
// Unknown strings map to Permission.
GovernanceMode governanceModeFromString(const QString& str);

enum class RiskLevel {
    Safe,
    Sensitive,
    Dangerous,
};

QString riskLevelToString(RiskLevel level);
// Unknown strings map to Safe.
RiskLevel riskLevelFromString(const QString& str);

enum class AllowedStatus {
    Allowed,
    Blocked,
    PromptRequired,
};

QString allowedStatusToString(AllowedStatus status);

struct QStringHash {
    size_t operator()(const QString& s) const { return qHash(s); }
};

} // namespace sv
