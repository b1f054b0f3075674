#include "core/shared/governance_types.h"

#include <QJsonArray>

#include <algorithm>

namespace vd {

namespace {

QString formatTime(const QDateTime& dt)
{
    return dt.isValid() ? dt.toUTC().toString(Qt::ISODateWithMs) : QString();
}

QDateTime parseTime(const QJsonValue& value)
{
    const QString text = value.toString();
    if (text.isEmpty()) {
        return {};
    }
    QDateTime dt = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(text, Qt::ISODate);
    }
    return dt;
}

} // namespace

QJsonObject GovernanceResponse::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("request_id")] = requestId;
    obj[QStringLiteral("decision")] = decisionToString(decision);
    obj[QStringLiteral("confidence")] = confidence;
    obj[QStringLiteral("reasoning")] = reasoning;
    obj[QStringLiteral("model_version")] = modelVersion;
    obj[QStringLiteral("features")] = features.toJson();
    obj[QStringLiteral("processing_time_ms")] = processingTimeMs;
    obj[QStringLiteral("timestamp")] = formatTime(timestamp);
    if (abTest) {
        QJsonObject ab;
        ab[QStringLiteral("test_id")] = abTest->testId;
        ab[QStringLiteral("cohort")] = abCohortToString(abTest->cohort);
        obj[QStringLiteral("ab_test")] = ab;
    }
    obj[QStringLiteral("fallback_used")] = fallbackUsed;
    if (fallbackUsed) {
        obj[QStringLiteral("fallback_reason")] = fallbackReason;
    }
    return obj;
}

std::optional<GovernanceResponse> GovernanceResponse::fromJson(const QJsonObject& obj)
{
    GovernanceResponse response;
    response.requestId = obj.value(QStringLiteral("request_id")).toString();
    if (response.requestId.isEmpty()) {
        return std::nullopt;
    }

    const std::optional<Decision> decision =
        decisionFromString(obj.value(QStringLiteral("decision")).toString());
    if (!decision) {
        return std::nullopt;
    }
    response.decision = *decision;

    const std::optional<FeatureVector> features =
        FeatureVector::fromJson(obj.value(QStringLiteral("features")).toObject());
    if (!features) {
        return std::nullopt;
    }
    response.features = *features;

    response.confidence = std::clamp(obj.value(QStringLiteral("confidence")).toDouble(0.5), 0.0, 1.0);
    response.reasoning = obj.value(QStringLiteral("reasoning")).toString();
    response.modelVersion = obj.value(QStringLiteral("model_version")).toString();
    response.processingTimeMs = obj.value(QStringLiteral("processing_time_ms")).toDouble(0.0);
    response.timestamp = parseTime(obj.value(QStringLiteral("timestamp")));

    const QJsonObject ab = obj.value(QStringLiteral("ab_test")).toObject();
    if (!ab.isEmpty()) {
        const std::optional<AbCohort> cohort =
            abCohortFromString(ab.value(QStringLiteral("cohort")).toString());
        const QString testId = ab.value(QStringLiteral("test_id")).toString();
        if (cohort && !testId.isEmpty()) {
            response.abTest = AbAssignment{testId, *cohort};
        }
    }

    response.fallbackUsed = obj.value(QStringLiteral("fallback_used")).toBool(false);
    response.fallbackReason = obj.value(QStringLiteral("fallback_reason")).toString();
    return response;
}

QJsonObject FeedbackSubmission::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("request_id")] = requestId;
    obj[QStringLiteral("user_id")] = userId;
    obj[QStringLiteral("feedback_type")] = feedbackTypeToString(feedbackType);
    if (correctDecision) {
        obj[QStringLiteral("correct_decision")] = decisionToString(*correctDecision);
    }
    obj[QStringLiteral("rationale")] = rationale;
    obj[QStringLiteral("severity")] = severity;
    obj[QStringLiteral("metadata")] = metadata;
    obj[QStringLiteral("submitted_at")] = formatTime(submittedAt);
    return obj;
}

QJsonObject ModelVersion::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("version_id")] = versionId;
    obj[QStringLiteral("model_type")] = modelTypeToString(modelType);
    obj[QStringLiteral("status")] = modelStatusToString(status);
    obj[QStringLiteral("accuracy")] = accuracy;
    obj[QStringLiteral("precision")] = precision;
    obj[QStringLiteral("recall")] = recall;
    obj[QStringLiteral("f1_score")] = f1Score;
    obj[QStringLiteral("training_samples")] = trainingSamples;
    obj[QStringLiteral("validation_samples")] = validationSamples;
    obj[QStringLiteral("created_at")] = formatTime(createdAt);
    obj[QStringLiteral("deployed_at")] = formatTime(deployedAt);
    obj[QStringLiteral("retired_at")] = formatTime(retiredAt);
    obj[QStringLiteral("metadata")] = metadata;
    return obj;
}

std::optional<ModelVersion> ModelVersion::fromJson(const QJsonObject& obj)
{
    ModelVersion version;
    version.versionId = obj.value(QStringLiteral("version_id")).toString();
    const std::optional<ModelType> type =
        modelTypeFromString(obj.value(QStringLiteral("model_type")).toString());
    const std::optional<ModelStatus> status =
        modelStatusFromString(obj.value(QStringLiteral("status")).toString());
    if (version.versionId.isEmpty() || !type || !status) {
        return std::nullopt;
    }
    version.modelType = *type;
    version.status = *status;
    version.accuracy = obj.value(QStringLiteral("accuracy")).toDouble(0.0);
    version.precision = obj.value(QStringLiteral("precision")).toDouble(0.0);
    version.recall = obj.value(QStringLiteral("recall")).toDouble(0.0);
    version.f1Score = obj.value(QStringLiteral("f1_score")).toDouble(0.0);
    version.trainingSamples = obj.value(QStringLiteral("training_samples")).toInt(0);
    version.validationSamples = obj.value(QStringLiteral("validation_samples")).toInt(0);
    version.createdAt = parseTime(obj.value(QStringLiteral("created_at")));
    version.deployedAt = parseTime(obj.value(QStringLiteral("deployed_at")));
    version.retiredAt = parseTime(obj.value(QStringLiteral("retired_at")));
    version.metadata = obj.value(QStringLiteral("metadata")).toObject();
    return version;
}

void CohortMetrics::recordRequest(double latencyMs, bool error)
{
    if (requests == 0 || latencyMs < minLatencyMs) {
        minLatencyMs = latencyMs;
    }
    maxLatencyMs = std::max(maxLatencyMs, latencyMs);
    totalLatencyMs += latencyMs;
    ++requests;
    if (error) {
        ++errors;
    }
}

void CohortMetrics::recordOutcome(bool correct)
{
    ++outcomes;
    if (correct) {
        ++correctOutcomes;
    }
}

double CohortMetrics::accuracy() const
{
    return outcomes > 0 ? static_cast<double>(correctOutcomes) / outcomes : 0.0;
}

double CohortMetrics::averageLatencyMs() const
{
    return requests > 0 ? totalLatencyMs / requests : 0.0;
}

double CohortMetrics::errorRate() const
{
    return requests > 0 ? static_cast<double>(errors) / requests : 0.0;
}

QJsonObject CohortMetrics::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("requests")] = requests;
    obj[QStringLiteral("errors")] = errors;
    obj[QStringLiteral("error_rate")] = errorRate();
    obj[QStringLiteral("avg_latency_ms")] = averageLatencyMs();
    obj[QStringLiteral("min_latency_ms")] = minLatencyMs;
    obj[QStringLiteral("max_latency_ms")] = maxLatencyMs;
    obj[QStringLiteral("outcomes")] = outcomes;
    obj[QStringLiteral("correct_outcomes")] = correctOutcomes;
    obj[QStringLiteral("accuracy")] = accuracy();
    return obj;
}

QJsonObject ABTest::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("test_id")] = testId;
    obj[QStringLiteral("champion_version")] = championVersion;
    obj[QStringLiteral("candidate_version")] = candidateVersion;
    obj[QStringLiteral("model_type")] = modelTypeToString(modelType);
    obj[QStringLiteral("traffic_split")] = trafficSplit;
    obj[QStringLiteral("status")] = abTestStatusToString(status);
    obj[QStringLiteral("started_at")] = formatTime(startedAt);
    obj[QStringLiteral("ended_at")] = formatTime(endedAt);
    obj[QStringLiteral("champion_metrics")] = championMetrics.toJson();
    obj[QStringLiteral("candidate_metrics")] = candidateMetrics.toJson();
    return obj;
}

QJsonObject DriftDetectionResult::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("check_id")] = checkId;
    obj[QStringLiteral("model_version")] = modelVersion;
    obj[QStringLiteral("drift_detected")] = driftDetected;
    obj[QStringLiteral("drift_score")] = driftScore;
    obj[QStringLiteral("threshold")] = threshold;
    obj[QStringLiteral("affected_features")] = QJsonArray::fromStringList(affectedFeatures);
    obj[QStringLiteral("severity")] = driftSeverityToString(severity);
    obj[QStringLiteral("reference_samples")] = referenceSamples;
    obj[QStringLiteral("current_samples")] = currentSamples;
    obj[QStringLiteral("timestamp")] = formatTime(timestamp);
    obj[QStringLiteral("details")] = details;
    return obj;
}

std::optional<DriftDetectionResult> DriftDetectionResult::fromJson(const QJsonObject& obj)
{
    DriftDetectionResult result;
    result.checkId = obj.value(QStringLiteral("check_id")).toString();
    result.modelVersion = obj.value(QStringLiteral("model_version")).toString();
    if (result.checkId.isEmpty()) {
        return std::nullopt;
    }
    result.driftDetected = obj.value(QStringLiteral("drift_detected")).toBool(false);
    result.driftScore = obj.value(QStringLiteral("drift_score")).toDouble(0.0);
    result.threshold = obj.value(QStringLiteral("threshold")).toDouble(0.1);
    for (const QJsonValue& value : obj.value(QStringLiteral("affected_features")).toArray()) {
        result.affectedFeatures.append(value.toString());
    }
    const QString severity = obj.value(QStringLiteral("severity")).toString();
    if (severity == QLatin1String("low")) {
        result.severity = DriftSeverity::Low;
    } else if (severity == QLatin1String("moderate")) {
        result.severity = DriftSeverity::Moderate;
    } else if (severity == QLatin1String("high")) {
        result.severity = DriftSeverity::High;
    } else if (severity == QLatin1String("critical")) {
        result.severity = DriftSeverity::Critical;
    }
    result.referenceSamples = obj.value(QStringLiteral("reference_samples")).toInt(0);
    result.currentSamples = obj.value(QStringLiteral("current_samples")).toInt(0);
    result.timestamp = parseTime(obj.value(QStringLiteral("timestamp")));
    result.details = obj.value(QStringLiteral("details")).toObject();
    return result;
}

} // namespace vd
