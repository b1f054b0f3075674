#include "core/models/classifier.h"
#include "core/models/online_learner.h"
#include "core/models/random_forest.h"

namespace vd {

std::unique_ptr<Classifier> classifierFromJson(const QJsonObject& obj, QString* errorOut)
{
    const std::optional<ModelType> type =
        modelTypeFromString(obj.value(QStringLiteral("type")).toString());
    if (!type) {
        if (errorOut) {
            *errorOut = QStringLiteral("unknown_model_type");
        }
        return nullptr;
    }

    switch (*type) {
    case ModelType::RandomForest:
        return RandomForest::fromJson(obj, errorOut);
    case ModelType::OnlineLearner:
        return OnlineLearner::fromJson(obj, errorOut);
    case ModelType::Ensemble:
        break;
    }

    if (errorOut) {
        *errorOut = QStringLiteral("unsupported_model_type");
    }
    return nullptr;
}

} // namespace vd
