#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(vdCore, "verdict.core")
Q_LOGGING_CATEGORY(vdModels, "verdict.models")
Q_LOGGING_CATEGORY(vdRouting, "verdict.routing")
Q_LOGGING_CATEGORY(vdLearning, "verdict.learning")
Q_LOGGING_CATEGORY(vdDrift, "verdict.drift")
Q_LOGGING_CATEGORY(vdStore, "verdict.store")
Q_LOGGING_CATEGORY(vdService, "verdict.service")
