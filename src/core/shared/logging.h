#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(svCore)
Q_DECLARE_LOGGING_CATEGORY(svExtraction)
Q_DECLARE_LOGGING_CATEGORY(svIngest)
Q_DECLARE_LOGGING_CATEGORY(svIndex)
Q_DECLARE_LOGGING_CATEGORY(svEmbedding)
Q_DECLARE_LOGGING_CATEGORY(svVector)
Q_DECLARE_LOGGING_CATEGORY(svRetrieval)
Q_DECLARE_LOGGING_CATEGORY(svExplainer)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
