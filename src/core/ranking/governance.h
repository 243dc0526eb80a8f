#pragma once

#include "core/shared/types.h"

namespace sv {

// Mode x risk tables used to rerank retrieval candidates.
//
//               safe    sensitive          dangerous
//   read_only   1.0     0.1 blocked        0.0 blocked
//   permission  1.0     0.8 prompt         0.5 prompt
//   bypass      1.0     1.0                1.0
class Governance {
public:
    static double multiplier(GovernanceMode mode, RiskLevel risk);
    static AllowedStatus allowedStatus(GovernanceMode mode, RiskLevel risk);
};

} // namespace sv
