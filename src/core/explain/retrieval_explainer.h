#pragma once

#include "core/shared/retrieval_candidate.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <atomic>
#include <cstdint>
#include <map>
#include <vector>

namespace sv {

class ChatProvider;

struct ExplainerConfig {
    QString model = QStringLiteral("gpt-4o-mini");
    double temperature = 0.3;
    int minSelected = 3;
    int maxSelected = 8;
    int maxRetries = 2;
    int snippetPromptChars = 200;
    int snippetRetryChars = 100;
};

struct ContextRequest {
    QString topic;
    QString reason;
};

struct DiscardedCandidate {
    QString chunkId;
    QString reason;
};

struct ExplainerOutput {
    QStringList selectedChunkIds;
    std::map<QString, QString> rationales;
    QStringList keyConcepts;
    std::vector<ContextRequest> missingContextRequests;
    double confidenceScore = 0.0;
    std::vector<DiscardedCandidate> discardedTop;
    int tokenCount = 0;
    bool usedFallback = false;
    QDateTime generatedAt = QDateTime::currentDateTimeUtc();

    bool isLowConfidence() const { return confidenceScore < 0.5; }
    bool hasMissingContext() const { return !missingContextRequests.empty(); }
    int selectionCount() const { return static_cast<int>(selectedChunkIds.size()); }

    QJsonObject toJson() const;
};

struct ExplainerMetrics {
    int64_t selectionCount = 0;
    int64_t retryCount = 0;
    int64_t validationFailures = 0;
    int64_t fallbackCount = 0;

    QJsonObject toJson() const;
};

// RetrievalExplainer: asks a chat model to pick the chunks that answer a
// query, with a rationale per pick.
//
// The model's reply is untrusted: ids that are not among the candidates are
// dropped together with their rationales, and the remaining selection must
// hold between minSelected and maxSelected ids (fewer is accepted only when
// there are fewer candidates than minSelected). A reply that fails to parse
// or validate is retried with a shorter prompt, up to maxRetries times.
// When every attempt fails the top minSelected candidates by score are
// returned with confidence 0.3. selectChunks() never throws.
class RetrievalExplainer {
public:
    using Config = ExplainerConfig;

    static constexpr double kFallbackConfidence = 0.3;
    static constexpr double kDefaultConfidence = 0.5;

    RetrievalExplainer(ChatProvider& chat, const Config& config = {});

    RetrievalExplainer(const RetrievalExplainer&) = delete;
    RetrievalExplainer& operator=(const RetrievalExplainer&) = delete;

    ExplainerOutput selectChunks(const QString& query,
                                 const std::vector<RetrievalCandidate>& candidates,
                                 int tokenBudget = 4000);

    ExplainerMetrics metrics() const;
    const Config& config() const { return m_config; }

    // Rough token estimate for a candidate: the snippet stands for about a
    // third of the chunk, at four characters per token.
    static int estimateTokens(const RetrievalCandidate& candidate);

    QString buildPrompt(const QString& query,
                        const std::vector<RetrievalCandidate>& candidates) const;
    QString buildRetryPrompt(const QString& query,
                             const std::vector<RetrievalCandidate>& candidates) const;

    // Throws ExplainerValidationError for a reply that is not a JSON object.
    static ExplainerOutput parseResponse(const QString& response,
                                         const std::vector<RetrievalCandidate>& candidates);

    // Empty string when valid, otherwise the reason.
    QString validate(const ExplainerOutput& output,
                     const std::vector<RetrievalCandidate>& candidates) const;

    ExplainerOutput applyTokenBudget(ExplainerOutput output,
                                     const std::vector<RetrievalCandidate>& candidates,
                                     int tokenBudget) const;

    ExplainerOutput fallbackOutput(const std::vector<RetrievalCandidate>& candidates,
                                   const QString& error) const;

private:
    QString callModel(const QString& userPrompt);

    ChatProvider& m_chat;
    Config m_config;

    std::atomic<int64_t> m_selectionCount{0};
    std::atomic<int64_t> m_retryCount{0};
    std::atomic<int64_t> m_validationFailures{0};
    std::atomic<int64_t> m_fallbackCount{0};
};

} // namespace sv
