#include "core/shared/types.h"

namespace sv {

QString documentStatusToString(DocumentStatus status)
{
    switch (status) {
    case DocumentStatus::Pending:  return QStringLiteral("pending");
    case DocumentStatus::Ingested: return QStringLiteral("ingested");
    case DocumentStatus::Failed:   return QStringLiteral("failed");
    case DocumentStatus::Stale:    return QStringLiteral("stale");
    }
    return QStringLiteral("pending");
}

DocumentStatus documentStatusFromString(const QString& str)
{
    if (str == QLatin1String("ingested")) return DocumentStatus::Ingested;
    if (str == QLatin1String("failed"))   return DocumentStatus::Failed;
    if (str == QLatin1String("stale"))    return DocumentStatus::Stale;
    return DocumentStatus::Pending;
}

QString jobStatusToString(JobStatus status)
{
    switch (status) {
    case JobStatus::Running:   return QStringLiteral("running");
    case JobStatus::Completed: return QStringLiteral("completed");
    case JobStatus::Failed:    return QStringLiteral("failed");
    }
    return QStringLiteral("running");
}

JobStatus jobStatusFromString(const QString& str)
{
    if (str == QLatin1String("completed")) return JobStatus::Completed;
    if (str == QLatin1String("failed"))    return JobStatus::Failed;
    return JobStatus::Running;
}

QString governanceModeToString(GovernanceMode mode)
{
    switch (mode) {
    case GovernanceMode::ReadOnly:   return QStringLiteral("read_only");
    case GovernanceMode::Permission: return QStringLiteral("permission");
    case GovernanceMode::Bypass:     return QStringLiteral("bypass");
    }
    return QStringLiteral("permission");
}

GovernanceMode governanceModeFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("read_only")) return GovernanceMode::ReadOnly;
    if (normalized == QLatin1String("bypass"))    return GovernanceMode::Bypass;
    return GovernanceMode::Permission;
}

QString riskLevelToString(RiskLevel level)
{
    switch (level) {
    case RiskLevel::Safe:      return QStringLiteral("safe");
    case RiskLevel::Sensitive: return QStringLiteral("sensitive");
    case RiskLevel::Dangerous: return QStringLiteral("dangerous");
    }
    return QStringLiteral("safe");
}

RiskLevel riskLevelFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("sensitive")) return RiskLevel::Sensitive;
    if (normalized == QLatin1String("dangerous")) return RiskLevel::Dangerous;
    return RiskLevel::Safe;
}

QString allowedStatusToString(AllowedStatus status)
{
    switch (status) {
    case AllowedStatus::Allowed:        return QStringLiteral("allowed");
    case AllowedStatus::Blocked:        return QStringLiteral("blocked");
    case AllowedStatus::PromptRequired: return QStringLiteral("prompt_required");
    }
    return QStringLiteral("allowed");
}

} // namespace sv
