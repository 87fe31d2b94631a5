#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(paCore)
Q_DECLARE_LOGGING_CATEGORY(paCatalog)
Q_DECLARE_LOGGING_CATEGORY(paQuery)
Q_DECLARE_LOGGING_CATEGORY(paRanking)
Q_DECLARE_LOGGING_CATEGORY(paAnswer)
Q_DECLARE_LOGGING_CATEGORY(paIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
