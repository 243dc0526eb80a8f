#include "core/explain/retrieval_explainer.h"

#include "core/explain/chat_provider.h"
#include "core/shared/errors.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QSet>

#include <algorithm>
#include <unordered_map>

namespace sv {

namespace {

const char* const kSystemPrompt = R"(You are a retrieval expert selecting the most relevant document chunks to answer a query.

Given:
- A user query
- A list of candidate chunks with IDs, scores, and snippets

Your task:
1. Select 3-12 chunks that best answer the query
2. Explain WHY each chunk is relevant (1-2 sentences)
3. Identify key concepts from the query and chunks
4. Note if important context is missing
5. Explain why you skipped high-scoring candidates (if any)

CRITICAL RULES:
- Only use chunk_ids from the provided list
- Never invent chunk_ids
- If no chunks are relevant, select the best available and note low confidence
- Prefer chunks that directly answer the query over tangentially related ones
- Avoid selecting highly redundant chunks

Output JSON format:
{
  "selected_chunk_ids": ["chunk-id-1", "chunk-id-2", ...],
  "rationales": {
    "chunk-id-1": "This chunk explains X which directly answers...",
    "chunk-id-2": "Contains the definition of Y mentioned in query..."
  },
  "key_concepts": ["concept1", "concept2"],
  "missing_context": [{"topic": "X", "reason": "Query asks about X but no chunks cover it"}],
  "confidence": 0.85,
  "discarded_top": [{"chunk_id": "high-scoring-id", "reason": "Off-topic despite high score"}]
})";

const char* const kUserPromptTemplate = R"(Query: %1

Candidate chunks (ranked by retrieval score):

%2

Select the most relevant chunks for answering this query. Return valid JSON only.)";

const char* const kRetryPromptTemplate = R"(Your previous response was not valid JSON. Please try again.

Query: %1

Candidate chunks (ranked by retrieval score):

%2

Return ONLY valid JSON matching this schema:
{
  "selected_chunk_ids": ["chunk-id-1", ...],
  "rationales": {"chunk-id-1": "reason..."},
  "key_concepts": ["concept1", ...],
  "missing_context": [{"topic": "X", "reason": "..."}],
  "confidence": 0.85,
  "discarded_top": [{"chunk_id": "...", "reason": "..."}]
})";

QString stripCodeFence(const QString& response)
{
    QString text = response.trimmed();
    if (!text.startsWith(QLatin1String("```"))) {
        return text;
    }

    static const QRegularExpression fenceRe(QStringLiteral("```(?:json)?\\s*([\\s\\S]*?)\\s*```"));
    const QRegularExpressionMatch match = fenceRe.match(text);
    if (match.hasMatch()) {
        return match.captured(1);
    }

    // Unterminated fence: drop the opening line and a trailing fence line.
    QStringList lines = text.split(QLatin1Char('\n'));
    if (!lines.isEmpty() && lines.first().startsWith(QLatin1String("```"))) {
        lines.removeFirst();
    }
    if (!lines.isEmpty() && lines.last().trimmed() == QLatin1String("```")) {
        lines.removeLast();
    }
    return lines.join(QLatin1Char('\n'));
}

std::vector<const RetrievalCandidate*> sortedByScore(const std::vector<RetrievalCandidate>& candidates)
{
    std::vector<const RetrievalCandidate*> sorted;
    sorted.reserve(candidates.size());
    for (const RetrievalCandidate& c : candidates) {
        sorted.push_back(&c);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const RetrievalCandidate* lhs, const RetrievalCandidate* rhs) {
                         return lhs->score > rhs->score;
                     });
    return sorted;
}

} // namespace

// ── ExplainerOutput ─────────────────────────────────────────

QJsonObject ExplainerOutput::toJson() const
{
    QJsonObject rationaleObj;
    for (const auto& [chunkId, rationale] : rationales) {
        rationaleObj[chunkId] = rationale;
    }

    QJsonArray missing;
    for (const ContextRequest& request : missingContextRequests) {
        missing.append(QJsonObject{{QStringLiteral("topic"), request.topic},
                                   {QStringLiteral("reason"), request.reason}});
    }

    QJsonArray discarded;
    for (const DiscardedCandidate& d : discardedTop) {
        discarded.append(QJsonObject{{QStringLiteral("chunk_id"), d.chunkId},
                                     {QStringLiteral("reason"), d.reason}});
    }

    QJsonObject json;
    json[QStringLiteral("selected_chunk_ids")] = QJsonArray::fromStringList(selectedChunkIds);
    json[QStringLiteral("rationales")] = rationaleObj;
    json[QStringLiteral("key_concepts")] = QJsonArray::fromStringList(keyConcepts);
    json[QStringLiteral("missing_context_requests")] = missing;
    json[QStringLiteral("confidence_score")] = confidenceScore;
    json[QStringLiteral("discarded_top")] = discarded;
    json[QStringLiteral("token_count")] = tokenCount;
    json[QStringLiteral("used_fallback")] = usedFallback;
    json[QStringLiteral("generated_at")] = generatedAt.toString(Qt::ISODateWithMs);
    return json;
}

QJsonObject ExplainerMetrics::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("selection_count")] = static_cast<double>(selectionCount);
    json[QStringLiteral("retry_count")] = static_cast<double>(retryCount);
    json[QStringLiteral("validation_failures")] = static_cast<double>(validationFailures);
    json[QStringLiteral("fallback_count")] = static_cast<double>(fallbackCount);
    return json;
}

// ── RetrievalExplainer ──────────────────────────────────────

RetrievalExplainer::RetrievalExplainer(ChatProvider& chat, const Config& config)
    : m_chat(chat)
    , m_config(config)
{
    m_config.minSelected = std::max(0, m_config.minSelected);
    m_config.maxSelected = std::max(m_config.minSelected, m_config.maxSelected);
    m_config.maxRetries = std::max(0, m_config.maxRetries);

    LOG_INFO(svExplainer, "RetrievalExplainer: model=%s temperature=%.2f select=[%d,%d]",
             qPrintable(m_config.model), m_config.temperature,
             m_config.minSelected, m_config.maxSelected);
}

ExplainerOutput RetrievalExplainer::selectChunks(const QString& rawQuery,
                                                 const std::vector<RetrievalCandidate>& candidates,
                                                 int tokenBudget)
{
    const QString query = rawQuery.trimmed();
    if (query.isEmpty() || candidates.empty()) {
        ExplainerOutput empty;
        empty.missingContextRequests.push_back({
            QStringLiteral("Retrieval"),
            query.isEmpty() ? QStringLiteral("Query is empty; nothing to select.")
                            : QStringLiteral("No candidates were retrieved for this query."),
        });
        LOG_WARN(svExplainer, "selectChunks called with %s",
                 query.isEmpty() ? "an empty query" : "no candidates");
        return empty;
    }

    LOG_INFO(svExplainer, "Selecting chunks: query='%s' candidates=%d budget=%d",
             qPrintable(query.left(50)), static_cast<int>(candidates.size()), tokenBudget);

    QString lastError;
    const int attempts = m_config.maxRetries + 1;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        QString prompt;
        if (attempt == 0) {
            prompt = buildPrompt(query, candidates);
        } else {
            ++m_retryCount;
            prompt = buildRetryPrompt(query, candidates);
        }

        try {
            const QString response = callModel(prompt);
            ExplainerOutput output = parseResponse(response, candidates);

            const QString invalid = validate(output, candidates);
            if (!invalid.isEmpty()) {
                lastError = invalid;
                ++m_validationFailures;
                LOG_WARN(svExplainer, "Validation failed (attempt %d): %s",
                         attempt + 1, qPrintable(invalid));
                continue;
            }

            output = applyTokenBudget(std::move(output), candidates, tokenBudget);
            ++m_selectionCount;
            LOG_INFO(svExplainer, "Selection complete: selected=%d confidence=%.2f",
                     output.selectionCount(), output.confidenceScore);
            return output;
        } catch (const ExplainerValidationError& e) {
            lastError = QStringLiteral("JSON parse error: %1").arg(e.message());
            ++m_validationFailures;
            LOG_WARN(svExplainer, "Parse failed (attempt %d): %s", attempt + 1, e.what());
        } catch (const LlmCallError& e) {
            lastError = QStringLiteral("LLM call error: %1").arg(e.message());
            LOG_ERROR(svExplainer, "LLM call failed (attempt %d): %s", attempt + 1, e.what());
        }
    }

    LOG_ERROR(svExplainer, "Selection failed after %d attempts: %s",
              attempts, qPrintable(lastError));
    ++m_fallbackCount;
    return fallbackOutput(candidates, lastError);
}

QString RetrievalExplainer::callModel(const QString& userPrompt)
{
    ChatRequest request;
    request.model = m_config.model;
    request.temperature = m_config.temperature;
    request.messages.push_back({QStringLiteral("system"), QString::fromUtf8(kSystemPrompt)});
    request.messages.push_back({QStringLiteral("user"), userPrompt});

    const QString lowerModel = m_config.model.toLower();
    if (lowerModel.contains(QLatin1String("gpt")) || lowerModel.contains(QLatin1String("o1"))) {
        request.responseFormat = QJsonObject{{QStringLiteral("type"), QStringLiteral("json_object")}};
    }

    try {
        return m_chat.complete(request);
    } catch (const LlmCallError&) {
        throw;
    } catch (const std::exception& e) {
        throw LlmCallError(QString::fromUtf8(e.what()));
    }
}

QString RetrievalExplainer::buildPrompt(const QString& query,
                                        const std::vector<RetrievalCandidate>& candidates) const
{
    QStringList blocks;
    blocks.reserve(static_cast<int>(candidates.size()));
    int index = 1;
    for (const RetrievalCandidate& c : candidates) {
        QString block = QStringLiteral("[%1] ID: %2\n").arg(QString::number(index++), c.chunkId);
        block += QString::asprintf("    Score: %.4f (semantic: %.4f", c.score, c.semanticScore);
        if (c.bm25Score) {
            block += QString::asprintf(", bm25: %.4f", *c.bm25Score);
        }
        block += QStringLiteral(")\n");
        block += QStringLiteral("    Path: %1\n").arg(c.path);
        block += QStringLiteral("    Risk: %1 | Scope: %2\n")
                     .arg(riskLevelToString(c.riskLevel), c.scope);
        block += QStringLiteral("    Snippet: %1...").arg(c.snippet.left(m_config.snippetPromptChars));
        blocks.append(block);
    }

    return QString::fromUtf8(kUserPromptTemplate)
        .arg(query, blocks.join(QStringLiteral("\n\n")));
}

QString RetrievalExplainer::buildRetryPrompt(const QString& query,
                                             const std::vector<RetrievalCandidate>& candidates) const
{
    QStringList lines;
    lines.reserve(static_cast<int>(candidates.size()));
    for (const RetrievalCandidate& c : candidates) {
        lines.append(QStringLiteral("- %1: score=%2, snippet=\"%3...\"")
                         .arg(c.chunkId, QString::number(c.score, 'f', 3),
                              c.snippet.left(m_config.snippetRetryChars)));
    }

    return QString::fromUtf8(kRetryPromptTemplate)
        .arg(query, lines.join(QLatin1Char('\n')));
}

ExplainerOutput RetrievalExplainer::parseResponse(const QString& response,
                                                  const std::vector<RetrievalCandidate>& candidates)
{
    const QString body = stripCodeFence(response);

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw ExplainerValidationError(parseError.errorString());
    }
    if (!doc.isObject()) {
        throw ExplainerValidationError(QStringLiteral("response is not a JSON object"));
    }
    const QJsonObject data = doc.object();

    QSet<QString> validIds;
    for (const RetrievalCandidate& c : candidates) {
        validIds.insert(c.chunkId);
    }

    ExplainerOutput output;

    QStringList hallucinated;
    QSet<QString> seen;
    for (const QJsonValue& value : data.value(QStringLiteral("selected_chunk_ids")).toArray()) {
        const QString chunkId = value.toString();
        if (!validIds.contains(chunkId)) {
            hallucinated.append(value.isString() ? chunkId : QStringLiteral("<non-string>"));
            continue;
        }
        if (seen.contains(chunkId)) {
            continue;
        }
        seen.insert(chunkId);
        output.selectedChunkIds.append(chunkId);
    }
    if (!hallucinated.isEmpty()) {
        LOG_WARN(svExplainer, "Dropped %d hallucinated chunk ids: %s",
                 static_cast<int>(hallucinated.size()), qPrintable(hallucinated.join(QStringLiteral(", "))));
    }

    const QJsonObject rationales = data.value(QStringLiteral("rationales")).toObject();
    for (auto it = rationales.begin(); it != rationales.end(); ++it) {
        if (seen.contains(it.key()) && it.value().isString()) {
            output.rationales[it.key()] = it.value().toString();
        }
    }

    for (const QJsonValue& value : data.value(QStringLiteral("key_concepts")).toArray()) {
        if (value.isString()) {
            output.keyConcepts.append(value.toString());
        }
    }

    for (const QJsonValue& value : data.value(QStringLiteral("missing_context")).toArray()) {
        const QJsonObject item = value.toObject();
        if (item.isEmpty()) {
            continue;
        }
        output.missingContextRequests.push_back({item.value(QStringLiteral("topic")).toString(),
                                                 item.value(QStringLiteral("reason")).toString()});
    }

    const QJsonValue confidence = data.value(QStringLiteral("confidence"));
    output.confidenceScore = confidence.isDouble()
        ? std::clamp(confidence.toDouble(), 0.0, 1.0)
        : kDefaultConfidence;

    for (const QJsonValue& value : data.value(QStringLiteral("discarded_top")).toArray()) {
        const QJsonObject item = value.toObject();
        if (item.isEmpty()) {
            continue;
        }
        output.discardedTop.push_back({item.value(QStringLiteral("chunk_id")).toString(),
                                       item.value(QStringLiteral("reason")).toString()});
    }

    std::unordered_map<QString, const RetrievalCandidate*, QStringHash> byId;
    for (const RetrievalCandidate& c : candidates) {
        byId.emplace(c.chunkId, &c);
    }
    for (const QString& chunkId : output.selectedChunkIds) {
        output.tokenCount += estimateTokens(*byId.at(chunkId));
    }
    return output;
}

QString RetrievalExplainer::validate(const ExplainerOutput& output,
                                     const std::vector<RetrievalCandidate>& candidates) const
{
    QSet<QString> validIds;
    for (const RetrievalCandidate& c : candidates) {
        validIds.insert(c.chunkId);
    }
    for (const QString& chunkId : output.selectedChunkIds) {
        if (!validIds.contains(chunkId)) {
            return QStringLiteral("Invalid chunk_id: %1").arg(chunkId);
        }
    }

    const int count = output.selectionCount();
    if (count < m_config.minSelected
        && static_cast<int>(candidates.size()) >= m_config.minSelected) {
        return QStringLiteral("Selected %1 chunks, minimum is %2").arg(count).arg(m_config.minSelected);
    }
    if (count > m_config.maxSelected) {
        return QStringLiteral("Selected %1 chunks, maximum is %2").arg(count).arg(m_config.maxSelected);
    }
    if (output.confidenceScore < 0.0 || output.confidenceScore > 1.0) {
        return QStringLiteral("Confidence %1 not in [0, 1]").arg(output.confidenceScore);
    }
    return QString();
}

int RetrievalExplainer::estimateTokens(const RetrievalCandidate& candidate)
{
    return static_cast<int>(candidate.snippet.size()) * 3 / 4;
}

ExplainerOutput RetrievalExplainer::applyTokenBudget(ExplainerOutput output,
                                                     const std::vector<RetrievalCandidate>& candidates,
                                                     int tokenBudget) const
{
    if (output.tokenCount <= tokenBudget) {
        return output;
    }
    LOG_INFO(svExplainer, "Token budget exceeded (%d > %d), trimming",
             output.tokenCount, tokenBudget);

    std::unordered_map<QString, const RetrievalCandidate*, QStringHash> byId;
    for (const RetrievalCandidate& c : candidates) {
        byId.emplace(c.chunkId, &c);
    }

    std::vector<const RetrievalCandidate*> selected;
    for (const QString& chunkId : output.selectedChunkIds) {
        const auto it = byId.find(chunkId);
        if (it != byId.end()) {
            selected.push_back(it->second);
        }
    }
    std::stable_sort(selected.begin(), selected.end(),
                     [](const RetrievalCandidate* lhs, const RetrievalCandidate* rhs) {
                         return lhs->score > rhs->score;
                     });

    QStringList kept;
    int cumulative = 0;
    for (const RetrievalCandidate* c : selected) {
        const int tokens = estimateTokens(*c);
        if (cumulative + tokens <= tokenBudget) {
            kept.append(c->chunkId);
            cumulative += tokens;
        }
        if (kept.size() >= m_config.minSelected && cumulative >= tokenBudget * 0.8) {
            break;
        }
    }

    // Never go below the floor, even over budget.
    for (const RetrievalCandidate* c : selected) {
        if (kept.size() >= m_config.minSelected) {
            break;
        }
        if (!kept.contains(c->chunkId)) {
            kept.append(c->chunkId);
        }
    }

    std::map<QString, QString> keptRationales;
    int tokenCount = 0;
    for (const QString& chunkId : kept) {
        tokenCount += estimateTokens(*byId.at(chunkId));
        const auto it = output.rationales.find(chunkId);
        if (it != output.rationales.end()) {
            keptRationales.insert(*it);
        }
    }

    output.selectedChunkIds = kept;
    output.rationales = std::move(keptRationales);
    output.tokenCount = tokenCount;
    LOG_INFO(svExplainer, "Trimmed to %d chunks, ~%d tokens", static_cast<int>(kept.size()), tokenCount);
    return output;
}

ExplainerOutput RetrievalExplainer::fallbackOutput(const std::vector<RetrievalCandidate>& candidates,
                                                   const QString& error) const
{
    LOG_WARN(svExplainer, "Using score-based fallback selection: %s", qPrintable(error));

    const std::vector<const RetrievalCandidate*> sorted = sortedByScore(candidates);
    const size_t take = std::min(sorted.size(), static_cast<size_t>(m_config.minSelected));

    ExplainerOutput output;
    for (size_t i = 0; i < take; ++i) {
        const RetrievalCandidate* c = sorted[i];
        output.selectedChunkIds.append(c->chunkId);
        output.rationales[c->chunkId] =
            QStringLiteral("Fallback selection: highest scoring candidate (score=%1)")
                .arg(c->score, 0, 'f', 3);
        output.tokenCount += estimateTokens(*c);
    }
    output.missingContextRequests.push_back({
        QStringLiteral("LLM Selection"),
        QStringLiteral("LLM-based selection failed: %1. Using score-based fallback.").arg(error),
    });
    output.confidenceScore = kFallbackConfidence;
    output.usedFallback = true;
    return output;
}

ExplainerMetrics RetrievalExplainer::metrics() const
{
    ExplainerMetrics m;
    m.selectionCount = m_selectionCount.load();
    m.retryCount = m_retryCount.load();
    m.validationFailures = m_validationFailures.load();
    m.fallbackCount = m_fallbackCount.load();
    return m;
}

} // namespace sv
