#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ulCore)
Q_DECLARE_LOGGING_CATEGORY(ulExtraction)
Q_DECLARE_LOGGING_CATEGORY(ulIngest)
Q_DECLARE_LOGGING_CATEGORY(ulIndex)
Q_DECLARE_LOGGING_CATEGORY(ulRetrieval)
Q_DECLARE_LOGGING_CATEGORY(ulLlm)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
