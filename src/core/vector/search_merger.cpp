#include "core/vector/search_merger.h"

#include "core/shared/logging.h"
#include "core/shared/types.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace sv {

namespace {

constexpr double kWeightTolerance = 0.01;
constexpr double kDegenerateRange = 1e-12;

std::vector<double> scoresOf(const std::vector<ScoredId>& results)
{
    std::vector<double> scores;
    scores.reserve(results.size());
    for (const ScoredId& r : results) {
        scores.push_back(r.score);
    }
    return scores;
}

} // namespace

std::vector<double> SearchMerger::normalizeMinMax(const std::vector<double>& scores)
{
    if (scores.empty()) {
        return {};
    }

    const auto [minIt, maxIt] = std::minmax_element(scores.begin(), scores.end());
    const double lo = *minIt;
    const double range = *maxIt - lo;

    std::vector<double> normalized(scores.size(), 0.5);
    if (range <= kDegenerateRange) {
        return normalized;
    }
    for (size_t i = 0; i < scores.size(); ++i) {
        normalized[i] = (scores[i] - lo) / range;
    }
    return normalized;
}

bool SearchMerger::weightsSumToOne(const MergeConfig& config)
{
    return std::abs(config.semanticWeight + config.bm25Weight - 1.0) <= kWeightTolerance;
}

std::vector<MergedHit> SearchMerger::merge(const std::vector<ScoredId>& semanticResults,
                                           const std::vector<ScoredId>& lexicalResults,
                                           const MergeConfig& config)
{
    if (!weightsSumToOne(config)) {
        LOG_WARN(svRetrieval, "Hybrid weights do not sum to 1 (semantic=%.3f, bm25=%.3f)",
                 config.semanticWeight, config.bm25Weight);
    }

    std::vector<MergedHit> merged;
    merged.reserve(semanticResults.size() + lexicalResults.size());
    std::unordered_map<QString, size_t, QStringHash> indexById;

    // Semantic only: no lexical evidence to normalize against.
    if (lexicalResults.empty()) {
        const std::vector<double> norm = normalizeMinMax(scoresOf(semanticResults));
        for (size_t i = 0; i < semanticResults.size(); ++i) {
            const ScoredId& r = semanticResults[i];
            if (indexById.count(r.id)) {
                continue;
            }
            indexById.emplace(r.id, merged.size());
            MergedHit hit;
            hit.chunkId = r.id;
            hit.combinedScore = r.score;
            hit.semanticRaw = r.score;
            hit.semanticNorm = norm[i];
            hit.category = MergeCategory::SemanticOnly;
            merged.push_back(std::move(hit));
        }
    } else {
        const std::vector<double> semNorm = normalizeMinMax(scoresOf(semanticResults));
        const std::vector<double> lexNorm = normalizeMinMax(scoresOf(lexicalResults));

        for (size_t i = 0; i < semanticResults.size(); ++i) {
            const ScoredId& r = semanticResults[i];
            if (indexById.count(r.id)) {
                continue;
            }
            indexById.emplace(r.id, merged.size());
            MergedHit hit;
            hit.chunkId = r.id;
            hit.semanticRaw = r.score;
            hit.semanticNorm = semNorm[i];
            hit.category = MergeCategory::SemanticOnly;
            merged.push_back(std::move(hit));
        }

        for (size_t i = 0; i < lexicalResults.size(); ++i) {
            const ScoredId& r = lexicalResults[i];
            auto it = indexById.find(r.id);
            if (it == indexById.end()) {
                indexById.emplace(r.id, merged.size());
                MergedHit hit;
                hit.chunkId = r.id;
                hit.bm25Norm = lexNorm[i];
                hit.category = MergeCategory::LexicalOnly;
                merged.push_back(std::move(hit));
                continue;
            }
            MergedHit& hit = merged[it->second];
            if (!hit.bm25Norm.has_value()) {
                hit.bm25Norm = lexNorm[i];
                hit.category = MergeCategory::Both;
            }
        }

        for (MergedHit& hit : merged) {
            hit.combinedScore = config.semanticWeight * hit.semanticNorm.value_or(0.0)
                + config.bm25Weight * hit.bm25Norm.value_or(0.0);
        }
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const MergedHit& lhs, const MergedHit& rhs) {
                         if (lhs.combinedScore != rhs.combinedScore) {
                             return lhs.combinedScore > rhs.combinedScore;
                         }
                         return lhs.chunkId < rhs.chunkId;
                     });

    LOG_DEBUG(svRetrieval, "Merged %d semantic + %d lexical -> %d hits",
              static_cast<int>(semanticResults.size()),
              static_cast<int>(lexicalResults.size()),
              static_cast<int>(merged.size()));
    return merged;
}

} // namespace sv
