#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace sv {

struct ChatMessage {
    QString role;    // "system", "user" or "assistant"
    QString content;
};

struct ChatRequest {
    QString model;
    std::vector<ChatMessage> messages;
    double temperature = 0.3;
    std::optional<QJsonObject> responseFormat;
};

// Chat-completion backend used by the retrieval explainer.
// complete() returns the assistant text or throws LlmCallError.
class ChatProvider {
public:
    virtual ~ChatProvider() = default;

    virtual QString complete(const ChatRequest& request) = 0;
};

} // namespace sv
