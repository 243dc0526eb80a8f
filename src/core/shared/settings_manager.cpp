#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace sv {

namespace {

void readInt(const QJsonObject& json, const char* key, int& target)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isDouble()) {
        target = value.toInt(target);
    }
}

void readDouble(const QJsonObject& json, const char* key, double& target)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isDouble()) {
        target = value.toDouble(target);
    }
}

void readString(const QJsonObject& json, const char* key, QString& target)
{
    const QJsonValue value = json.value(QLatin1String(key));
    if (value.isString()) {
        target = value.toString();
    }
}

void readBool(const QJsonObject& json, const char* key, bool& target)
{
    target = json.value(QLatin1String(key)).toBool(target);
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(svCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(svCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

Settings SettingsManager::loadOrDefault(const QString& filePath)
{
    if (auto settings = load(filePath)) {
        return *settings;
    }
    LOG_INFO(svCore, "Using default settings (no usable file at %s)", qUtf8Printable(filePath));
    return Settings{};
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(svCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(svCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(svCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return basePath + QStringLiteral("/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject chunker;
    chunker.insert(QStringLiteral("target_tokens"), settings.chunker.targetTokens);
    chunker.insert(QStringLiteral("overlap_tokens"), settings.chunker.overlapTokens);
    chunker.insert(QStringLiteral("min_tokens"), settings.chunker.minTokens);
    chunker.insert(QStringLiteral("max_tokens"), settings.chunker.maxTokens);

    QJsonObject embedding;
    embedding.insert(QStringLiteral("batch_size"), settings.embedding.batchSize);
    embedding.insert(QStringLiteral("max_retries"), settings.embedding.maxRetries);
    embedding.insert(QStringLiteral("retry_base_delay_ms"), settings.embedding.retryBaseDelayMs);
    embedding.insert(QStringLiteral("transient_base_delay_ms"), settings.embedding.transientBaseDelayMs);
    embedding.insert(QStringLiteral("calls_per_minute"), settings.rateLimiter.callsPerMinute);

    QJsonObject vectorIndex;
    vectorIndex.insert(QStringLiteral("dimensions"), settings.vectorIndex.dimensions);
    vectorIndex.insert(QStringLiteral("collection"), settings.vectorIndex.collection);
    vectorIndex.insert(QStringLiteral("snapshot_dir"), settings.vectorIndex.snapshotDir);
    vectorIndex.insert(QStringLiteral("initial_capacity"), settings.vectorIndex.initialCapacity);

    QJsonObject retriever;
    retriever.insert(QStringLiteral("semantic_weight"), settings.retriever.semanticWeight);
    retriever.insert(QStringLiteral("bm25_weight"), settings.retriever.bm25Weight);
    retriever.insert(QStringLiteral("enable_lexical"), settings.retriever.enableLexical);
    retriever.insert(QStringLiteral("snippet_chars"), settings.retriever.snippetChars);
    retriever.insert(QStringLiteral("slow_search_warn_ms"), settings.retriever.slowSearchWarnMs);
    retriever.insert(QStringLiteral("bm25_k1"), settings.retriever.bm25.k1);
    retriever.insert(QStringLiteral("bm25_b"), settings.retriever.bm25.b);
    retriever.insert(QStringLiteral("query_cache_ttl_ms"), settings.queryCache.ttlMs);
    retriever.insert(QStringLiteral("query_cache_max_entries"), settings.queryCache.maxEntries);

    QJsonObject explainer;
    explainer.insert(QStringLiteral("model"), settings.explainer.model);
    explainer.insert(QStringLiteral("temperature"), settings.explainer.temperature);
    explainer.insert(QStringLiteral("min_selected"), settings.explainer.minSelected);
    explainer.insert(QStringLiteral("max_selected"), settings.explainer.maxSelected);
    explainer.insert(QStringLiteral("max_retries"), settings.explainer.maxRetries);

    QJsonObject json;
    json.insert(QStringLiteral("manifest_path"), settings.manifestPath);
    json.insert(QStringLiteral("chunker"), chunker);
    json.insert(QStringLiteral("embedding"), embedding);
    json.insert(QStringLiteral("vector_index"), vectorIndex);
    json.insert(QStringLiteral("retriever"), retriever);
    json.insert(QStringLiteral("explainer"), explainer);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    readString(json, "manifest_path", settings.manifestPath);

    const QJsonObject chunker = json.value(QStringLiteral("chunker")).toObject();
    readInt(chunker, "target_tokens", settings.chunker.targetTokens);
    readInt(chunker, "overlap_tokens", settings.chunker.overlapTokens);
    readInt(chunker, "min_tokens", settings.chunker.minTokens);
    readInt(chunker, "max_tokens", settings.chunker.maxTokens);

    const QJsonObject embedding = json.value(QStringLiteral("embedding")).toObject();
    readInt(embedding, "batch_size", settings.embedding.batchSize);
    readInt(embedding, "max_retries", settings.embedding.maxRetries);
    readInt(embedding, "retry_base_delay_ms", settings.embedding.retryBaseDelayMs);
    readInt(embedding, "transient_base_delay_ms", settings.embedding.transientBaseDelayMs);
    readInt(embedding, "calls_per_minute", settings.rateLimiter.callsPerMinute);

    const QJsonObject vectorIndex = json.value(QStringLiteral("vector_index")).toObject();
    readInt(vectorIndex, "dimensions", settings.vectorIndex.dimensions);
    readString(vectorIndex, "collection", settings.vectorIndex.collection);
    readString(vectorIndex, "snapshot_dir", settings.vectorIndex.snapshotDir);
    readInt(vectorIndex, "initial_capacity", settings.vectorIndex.initialCapacity);

    const QJsonObject retriever = json.value(QStringLiteral("retriever")).toObject();
    readDouble(retriever, "semantic_weight", settings.retriever.semanticWeight);
    readDouble(retriever, "bm25_weight", settings.retriever.bm25Weight);
    readBool(retriever, "enable_lexical", settings.retriever.enableLexical);
    readInt(retriever, "snippet_chars", settings.retriever.snippetChars);
    readInt(retriever, "slow_search_warn_ms", settings.retriever.slowSearchWarnMs);
    readDouble(retriever, "bm25_k1", settings.retriever.bm25.k1);
    readDouble(retriever, "bm25_b", settings.retriever.bm25.b);
    readInt(retriever, "query_cache_ttl_ms", settings.queryCache.ttlMs);
    readInt(retriever, "query_cache_max_entries", settings.queryCache.maxEntries);

    const QJsonObject explainer = json.value(QStringLiteral("explainer")).toObject();
    readString(explainer, "model", settings.explainer.model);
    readDouble(explainer, "temperature", settings.explainer.temperature);
    readInt(explainer, "min_selected", settings.explainer.minSelected);
    readInt(explainer, "max_selected", settings.explainer.maxSelected);
    readInt(explainer, "max_retries", settings.explainer.maxRetries);

    return settings;
}

} // namespace sv
