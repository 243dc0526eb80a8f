#include "core/vector/vector_index_client.h"

#include <QJsonArray>

namespace sv {

bool payloadMatches(const QJsonObject& payload, const QString& scope, const QJsonObject& filters)
{
    if (!scope.isEmpty() && payload.value(QStringLiteral("scope")).toString() != scope) {
        return false;
    }

    for (auto it = filters.constBegin(); it != filters.constEnd(); ++it) {
        const QJsonValue actual = payload.value(it.key());
        if (it.value().isArray()) {
            if (!it.value().toArray().contains(actual)) {
                return false;
            }
        } else if (actual != it.value()) {
            return false;
        }
    }
    return true;
}

} // namespace sv
