#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace sv {

struct ScoredId {
    QString id;
    double score = 0.0;
};

struct MergeConfig {
    double semanticWeight = 0.6;
    double bm25Weight = 0.4;
};

enum class MergeCategory {
    Both,
    LexicalOnly,
    SemanticOnly,
};

struct MergedHit {
    QString chunkId;
    double combinedScore = 0.0;
    std::optional<double> semanticRaw;   // unset for lexical-only hits
    std::optional<double> semanticNorm;
    std::optional<double> bm25Norm;      // unset when lexical search did not see the chunk
    MergeCategory category = MergeCategory::SemanticOnly;
};

// Combines semantic and lexical result lists into one hybrid-scored list.
//
// Each list is min-max normalized on its own; a chunk missing from one list
// gets 0 for that component. When the lexical list is empty the raw
// semantic score is used as the combined score. Output is sorted by
// combined score descending, ties by chunk id.
class SearchMerger {
public:
    static std::vector<MergedHit> merge(const std::vector<ScoredId>& semanticResults,
                                        const std::vector<ScoredId>& lexicalResults,
                                        const MergeConfig& config = {});

    // Maps scores onto [0,1]. A degenerate range (all equal) maps to 0.5.
    static std::vector<double> normalizeMinMax(const std::vector<double>& scores);

    static bool weightsSumToOne(const MergeConfig& config);
};

} // namespace sv
