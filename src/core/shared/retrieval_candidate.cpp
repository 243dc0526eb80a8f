#include "core/shared/retrieval_candidate.h"

namespace sv {

QJsonObject RetrievalCandidate::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("chunk_id")] = chunkId;
    json[QStringLiteral("doc_id")] = docId;
    json[QStringLiteral("path")] = path;
    json[QStringLiteral("score")] = score;
    json[QStringLiteral("semantic_score")] = semanticScore;
    json[QStringLiteral("bm25_score")] = bm25Score ? QJsonValue(*bm25Score) : QJsonValue();
    json[QStringLiteral("snippet")] = snippet;
    json[QStringLiteral("scope")] = scope;
    json[QStringLiteral("risk_level")] = riskLevelToString(riskLevel);
    json[QStringLiteral("allowed_in_mode")] = allowedStatusToString(allowedInMode);
    json[QStringLiteral("metadata")] = metadata;
    json[QStringLiteral("rank")] = rank;
    return json;
}

} // namespace sv
