#include "core/ranking/governance.h"

namespace sv {

double Governance::multiplier(GovernanceMode mode, RiskLevel risk)
{
    if (risk == RiskLevel::Safe) {
        return 1.0;
    }

    switch (mode) {
    case GovernanceMode::ReadOnly:
        return risk == RiskLevel::Sensitive ? 0.1 : 0.0;
    case GovernanceMode::Permission:
        return risk == RiskLevel::Sensitive ? 0.8 : 0.5;
    case GovernanceMode::Bypass:
        return 1.0;
    }
    return 1.0;
}

AllowedStatus Governance::allowedStatus(GovernanceMode mode, RiskLevel risk)
{
    if (risk == RiskLevel::Safe) {
        return AllowedStatus::Allowed;
    }

    switch (mode) {
    case GovernanceMode::ReadOnly:
        return AllowedStatus::Blocked;
    case GovernanceMode::Permission:
        return AllowedStatus::PromptRequired;
    case GovernanceMode::Bypass:
        return AllowedStatus::Allowed;
    }
    return AllowedStatus::Allowed;
}

} // namespace sv
