#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(nrCore)
Q_DECLARE_LOGGING_CATEGORY(nrRanking)
Q_DECLARE_LOGGING_CATEGORY(nrExperiment)
Q_DECLARE_LOGGING_CATEGORY(nrBandit)
Q_DECLARE_LOGGING_CATEGORY(nrMetrics)
Q_DECLARE_LOGGING_CATEGORY(nrStore)
Q_DECLARE_LOGGING_CATEGORY(nrIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
