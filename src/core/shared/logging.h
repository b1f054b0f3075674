#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(vdCore)
Q_DECLARE_LOGGING_CATEGORY(vdModels)
Q_DECLARE_LOGGING_CATEGORY(vdRouting)
Q_DECLARE_LOGGING_CATEGORY(vdLearning)
Q_DECLARE_LOGGING_CATEGORY(vdDrift)
Q_DECLARE_LOGGING_CATEGORY(vdStore)
Q_DECLARE_LOGGING_CATEGORY(vdService)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
