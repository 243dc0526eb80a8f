#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <optional>

namespace sv {

// One ranked hit produced by the hybrid retriever. Never persisted.
struct RetrievalCandidate {
    QString chunkId;
    QString docId;
    QString path;
    double score = 0.0;         // combined score after governance
    double semanticScore = 0.0; // raw vector similarity
    std::optional<double> bm25Score; // normalized lexical score, if lexical search contributed
    QString snippet;
    QString scope;
    RiskLevel riskLevel = RiskLevel::Safe;
    AllowedStatus allowedInMode = AllowedStatus::Allowed;
    QJsonObject metadata;
    int rank = 0; // 1-indexed, assigned after the final sort

    QJsonObject toJson() const;
};

} // namespace sv
