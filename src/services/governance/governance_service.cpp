#include "services/governance/governance_service.h"
#include "core/shared/logging.h"

#include <QJsonArray>

#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace vd {

namespace {

constexpr int kDefaultHistoryLimit = 20;
constexpr int kMaxHistoryLimit = 1000;

// Reads an optional string parameter. Present but not a string is an error.
bool readString(const QJsonObject& params, const QString& key, QString* out, QString* errorOut)
{
    const QJsonValue value = params.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isString()) {
        *errorOut = QStringLiteral("'%1' must be a string").arg(key);
        return false;
    }
    *out = value.toString();
    return true;
}

bool readBool(const QJsonObject& params, const QString& key, bool* out, QString* errorOut)
{
    const QJsonValue value = params.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isBool()) {
        *errorOut = QStringLiteral("'%1' must be a boolean").arg(key);
        return false;
    }
    *out = value.toBool();
    return true;
}

bool requireString(const QJsonObject& params, const QString& key, QString* out, QString* errorOut)
{
    if (!readString(params, key, out, errorOut)) {
        return false;
    }
    if (out->isEmpty()) {
        *errorOut = QStringLiteral("'%1' is required").arg(key);
        return false;
    }
    return true;
}

// Registry and engine errors that mean the target does not exist.
ServiceErrorCode codeForEngineError(const QString& error)
{
    if (error == QLatin1String("unknown_version") || error == QLatin1String("unknown_ab_test")) {
        return ServiceErrorCode::NotFound;
    }
    return ServiceErrorCode::InvalidParams;
}

} // namespace

GovernanceService::GovernanceService(GovernanceEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
{
    connect(&m_maintenanceTimer, &QTimer::timeout, this, &GovernanceService::runMaintenance);
    connect(&m_driftTimer, &QTimer::timeout, this, &GovernanceService::runScheduledDriftCheck);
}

GovernanceService::~GovernanceService()
{
    stop();
}

// ── Transport ───────────────────────────────────────────────

void GovernanceService::start()
{
    if (!m_stdout.isOpen() && !m_stdout.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        LOG_ERROR(vdService, "GovernanceService: cannot open stdout: %s",
                  qUtf8Printable(m_stdout.errorString()));
    }

    m_stdinNotifier = std::make_unique<QSocketNotifier>(STDIN_FILENO, QSocketNotifier::Read);
    connect(m_stdinNotifier.get(), &QSocketNotifier::activated, this, &GovernanceService::readInput);

    const EngineSettings& settings = m_engine->settings();
    if (settings.maintenanceIntervalMinutes > 0) {
        m_maintenanceTimer.start(settings.maintenanceIntervalMinutes * 60 * 1000);
    }
    if (settings.driftMode != QLatin1String("disabled") && settings.driftCheckIntervalMinutes > 0) {
        m_driftTimer.start(settings.driftCheckIntervalMinutes * 60 * 1000);
    }
    LOG_INFO(vdService, "GovernanceService: listening on stdin");
}

void GovernanceService::stop()
{
    m_maintenanceTimer.stop();
    m_driftTimer.stop();
    if (m_stdinNotifier) {
        m_stdinNotifier->setEnabled(false);
        m_stdinNotifier.reset();
    }
    waitForBackgroundJob();
}

void GovernanceService::readInput()
{
    char chunk[65536];
    const ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
    const int readError = errno;
    const InputReadStatus status = classifyInputRead(n, readError);
    if (status == InputReadStatus::Retry) {
        return;
    }
    if (status == InputReadStatus::Closed) {
        if (n < 0) {
            LOG_WARN(vdService, "GovernanceService: stdin read failed: %s",
                     std::strerror(readError));
        }
        if (!m_inputBuffer.trimmed().isEmpty()) {
            processLine(m_inputBuffer);
        }
        m_inputBuffer.clear();
        LOG_INFO(vdService, "GovernanceService: input closed");
        stop();
        emit inputClosed();
        return;
    }
    m_inputBuffer.append(chunk, static_cast<int>(n));

    int newline = -1;
    while ((newline = m_inputBuffer.indexOf('\n')) >= 0) {
        const QByteArray line = m_inputBuffer.left(newline);
        m_inputBuffer.remove(0, newline + 1);
        if (!line.trimmed().isEmpty()) {
            processLine(line);
        }
    }
    if (m_inputBuffer.size() > ServiceMessage::kMaxLineSize) {
        LOG_WARN(vdService, "GovernanceService: discarding oversized input line");
        m_inputBuffer.clear();
        writeLine(ServiceMessage::makeError(QJsonValue(), ServiceErrorCode::InvalidParams,
                                            QStringLiteral("message too large")));
    }
}

void GovernanceService::processLine(const QByteArray& line)
{
    QString error;
    const std::optional<QJsonObject> request = ServiceMessage::decodeLine(line, &error);
    if (!request) {
        LOG_WARN(vdService, "GovernanceService: malformed request: %s", qUtf8Printable(error));
        writeLine(ServiceMessage::makeError(QJsonValue(), ServiceErrorCode::InvalidParams, error));
        return;
    }
    writeLine(handleRequest(*request));
}

void GovernanceService::writeLine(const QJsonObject& json)
{
    if (!m_stdout.isOpen()) {
        return;
    }
    const QByteArray line = ServiceMessage::encodeLine(json);
    if (m_stdout.write(line) != line.size()) {
        LOG_WARN(vdService, "GovernanceService: short write on stdout");
    }
}

// ── Timers ──────────────────────────────────────────────────

bool GovernanceService::runInBackground(const QString& name, std::function<void()> job)
{
    if (m_backgroundRunning.load()) {
        LOG_INFO(vdService, "GovernanceService: skipping %s, previous job still running",
                 qUtf8Printable(name));
        return false;
    }
    waitForBackgroundJob();

    m_backgroundRunning.store(true);
    m_backgroundThread = std::thread([this, name, job = std::move(job)]() {
        LOG_DEBUG(vdService, "GovernanceService: %s started", qUtf8Printable(name));
        job();
        LOG_DEBUG(vdService, "GovernanceService: %s finished", qUtf8Printable(name));
        m_backgroundRunning.store(false);
    });
    return true;
}

void GovernanceService::waitForBackgroundJob()
{
    if (m_backgroundThread.joinable()) {
        m_backgroundThread.join();
    }
}

void GovernanceService::runMaintenance()
{
    GovernanceEngine* engine = m_engine;
    runInBackground(QStringLiteral("maintenance"), [engine]() {
        engine->runMaintenance();
    });
}

void GovernanceService::runScheduledDriftCheck()
{
    GovernanceEngine* engine = m_engine;
    // Result is recorded in drift history by the monitor.
    runInBackground(QStringLiteral("drift check"), [engine]() {
        engine->driftCheck();
    });
}

// ── Dispatch ────────────────────────────────────────────────

QJsonObject GovernanceService::handleRequest(const QJsonObject& request)
{
    const QJsonValue id = request.value(QStringLiteral("id"));
    const QString method = request.value(QStringLiteral("method")).toString();
    const QJsonValue paramsValue = request.value(QStringLiteral("params"));

    if (method.isEmpty()) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                         QStringLiteral("Missing 'method'"));
    }
    if (!paramsValue.isUndefined() && !paramsValue.isNull() && !paramsValue.isObject()) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                         QStringLiteral("'params' must be an object"));
    }
    if (!m_engine || !m_engine->isInitialized()) {
        return ServiceMessage::makeError(id, ServiceErrorCode::ServiceUnavailable,
                                         QStringLiteral("Engine not initialized"));
    }
    const QJsonObject params = paramsValue.toObject();

    if (method == QLatin1String("predict"))                return handlePredict(id, params);
    if (method == QLatin1String("submit_feedback"))        return handleSubmitFeedback(id, params);
    if (method == QLatin1String("status"))                 return handleStatus(id);
    if (method == QLatin1String("model_metrics"))          return handleModelMetrics(id);
    if (method == QLatin1String("drift_check"))            return handleDriftCheck(id, params);
    if (method == QLatin1String("drift_history"))          return handleDriftHistory(id, params);
    if (method == QLatin1String("ab_tests"))               return handleAbTests(id);
    if (method == QLatin1String("online_learning_status")) return handleOnlineLearningStatus(id);
    if (method == QLatin1String("create_ab_test"))         return handleCreateAbTest(id, params);
    if (method == QLatin1String("conclude_ab_test"))       return handleConcludeAbTest(id, params);
    if (method == QLatin1String("promote_model"))          return handlePromoteModel(id, params);

    return ServiceMessage::makeError(id, ServiceErrorCode::NotFound,
                                     QStringLiteral("Unknown method: %1").arg(method));
}

// ── Handlers ────────────────────────────────────────────────

QJsonObject GovernanceService::handlePredict(const QJsonValue& id, const QJsonObject& params)
{
    const QJsonValue content = params.value(QStringLiteral("content"));
    if (!content.isString()) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                         QStringLiteral("'content' must be a string"));
    }
    const QJsonValue context = params.value(QStringLiteral("context"));
    if (!context.isUndefined() && !context.isNull() && !context.isObject()) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                         QStringLiteral("'context' must be an object"));
    }

    GovernanceRequest request;
    request.content = content.toString();
    request.context = RequestContext::fromJson(context.toObject());
    bool useAbTest = false;
    QString error;
    if (!readString(params, QStringLiteral("user_id"), &request.userId, &error)
        || !readString(params, QStringLiteral("session_id"), &request.sessionId, &error)
        || !readString(params, QStringLiteral("request_id"), &request.requestId, &error)
        || !readBool(params, QStringLiteral("use_ab_test"), &useAbTest, &error)) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams, error);
    }
    if (!request.context.ignoredKeys.isEmpty()) {
        LOG_DEBUG(vdService, "GovernanceService: ignoring context keys: %s",
                  qUtf8Printable(request.context.ignoredKeys.join(QLatin1Char(','))));
    }

    const GovernanceResponse response = m_engine->predict(request, useAbTest);
    return ServiceMessage::makeResponse(id, response.toJson());
}

QJsonObject GovernanceService::handleSubmitFeedback(const QJsonValue& id, const QJsonObject& params)
{
    FeedbackSubmission feedback;
    QString error;
    QString typeText;
    QString decisionText;
    if (!requireString(params, QStringLiteral("request_id"), &feedback.requestId, &error)
        || !requireString(params, QStringLiteral("feedback_type"), &typeText, &error)
        || !readString(params, QStringLiteral("correct_decision"), &decisionText, &error)
        || !readString(params, QStringLiteral("rationale"), &feedback.rationale, &error)
        || !readString(params, QStringLiteral("severity"), &feedback.severity, &error)
        || !readString(params, QStringLiteral("user_id"), &feedback.userId, &error)) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams, error);
    }

    const std::optional<FeedbackType> type = feedbackTypeFromString(typeText);
    if (!type) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                         QStringLiteral("Unknown feedback_type: %1").arg(typeText));
    }
    feedback.feedbackType = *type;

    if (!decisionText.isEmpty()) {
        feedback.correctDecision = decisionFromString(decisionText);
        if (!feedback.correctDecision) {
            return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                             QStringLiteral("Unknown correct_decision: %1").arg(decisionText));
        }
    }

    const QJsonValue metadata = params.value(QStringLiteral("metadata"));
    if (!metadata.isUndefined() && !metadata.isNull()) {
        if (!metadata.isObject()) {
            return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                             QStringLiteral("'metadata' must be an object"));
        }
        feedback.metadata = metadata.toObject();
    }
    feedback.submittedAt = QDateTime::currentDateTimeUtc();

    QJsonObject result;
    result[QStringLiteral("accepted")] = m_engine->submitFeedback(feedback);
    result[QStringLiteral("request_id")] = feedback.requestId;
    return ServiceMessage::makeResponse(id, result);
}

QJsonObject GovernanceService::handleStatus(const QJsonValue& id)
{
    return ServiceMessage::makeResponse(id, m_engine->status());
}

QJsonObject GovernanceService::handleModelMetrics(const QJsonValue& id)
{
    return ServiceMessage::makeResponse(id, m_engine->modelMetrics());
}

QJsonObject GovernanceService::handleDriftCheck(const QJsonValue& id, const QJsonObject& params)
{
    QString versionId;
    QString error;
    if (!readString(params, QStringLiteral("model_version"), &versionId, &error)) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams, error);
    }
    if (!versionId.isEmpty() && !m_engine->registry().version(versionId)) {
        return ServiceMessage::makeError(id, ServiceErrorCode::NotFound,
                                         QStringLiteral("Unknown model version: %1").arg(versionId));
    }

    const std::optional<DriftDetectionResult> result = m_engine->driftCheck(versionId);
    if (!result) {
        QJsonObject noData;
        noData[QStringLiteral("no_data")] = true;
        noData[QStringLiteral("model_version")] = versionId.isEmpty()
            ? QJsonValue(m_engine->registry().activeVersion(ModelType::RandomForest).value_or(QString()))
            : QJsonValue(versionId);
        return ServiceMessage::makeResponse(id, noData);
    }
    return ServiceMessage::makeResponse(id, result->toJson());
}

QJsonObject GovernanceService::handleDriftHistory(const QJsonValue& id, const QJsonObject& params)
{
    QString versionId;
    QString error;
    if (!readString(params, QStringLiteral("model_version"), &versionId, &error)) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams, error);
    }
    int limit = kDefaultHistoryLimit;
    const QJsonValue limitValue = params.value(QStringLiteral("limit"));
    if (!limitValue.isUndefined() && !limitValue.isNull()) {
        if (!limitValue.isDouble() || limitValue.toInt(-1) < 1 || limitValue.toInt() > kMaxHistoryLimit) {
            return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                             QStringLiteral("'limit' must be an integer in [1, %1]")
                                                 .arg(kMaxHistoryLimit));
        }
        limit = limitValue.toInt();
    }

    QJsonArray checks;
    for (const DriftDetectionResult& result : m_engine->driftHistory(versionId, limit)) {
        checks.append(result.toJson());
    }
    QJsonObject result;
    result[QStringLiteral("checks")] = checks;
    return ServiceMessage::makeResponse(id, result);
}

QJsonObject GovernanceService::handleAbTests(const QJsonValue& id)
{
    const int minSamples = m_engine->settings().abMinSamples;
    QJsonArray tests;
    for (const ABTest& test : m_engine->abTests()) {
        QJsonObject obj = test.toJson();
        obj[QStringLiteral("comparison")] = compareCohorts(test, minSamples).toJson();
        tests.append(obj);
    }
    QJsonObject result;
    result[QStringLiteral("tests")] = tests;
    return ServiceMessage::makeResponse(id, result);
}

QJsonObject GovernanceService::handleOnlineLearningStatus(const QJsonValue& id)
{
    QJsonArray learners;
    for (const LearnerStatus& status : m_engine->onlineLearningStatus()) {
        learners.append(status.toJson());
    }
    QJsonObject result;
    result[QStringLiteral("learners")] = learners;
    return ServiceMessage::makeResponse(id, result);
}

QJsonObject GovernanceService::handleCreateAbTest(const QJsonValue& id, const QJsonObject& params)
{
    QString champion;
    QString candidate;
    QString error;
    if (!requireString(params, QStringLiteral("champion"), &champion, &error)
        || !requireString(params, QStringLiteral("candidate"), &candidate, &error)) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams, error);
    }
    double split = 0.1;
    const QJsonValue splitValue = params.value(QStringLiteral("traffic_split"));
    if (!splitValue.isUndefined() && !splitValue.isNull()) {
        if (!splitValue.isDouble()) {
            return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams,
                                             QStringLiteral("'traffic_split' must be a number"));
        }
        split = splitValue.toDouble();
    }

    const std::optional<ABTest> test = m_engine->createAbTest(champion, candidate, split, &error);
    if (!test) {
        return ServiceMessage::makeError(id, codeForEngineError(error), error);
    }
    QJsonObject result;
    result[QStringLiteral("test")] = test->toJson();
    return ServiceMessage::makeResponse(id, result);
}

QJsonObject GovernanceService::handleConcludeAbTest(const QJsonValue& id, const QJsonObject& params)
{
    QString testId;
    bool force = false;
    QString error;
    if (!requireString(params, QStringLiteral("test_id"), &testId, &error)
        || !readBool(params, QStringLiteral("force"), &force, &error)) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams, error);
    }

    const std::optional<AbConclusion> conclusion = m_engine->concludeAbTest(testId, force, &error);
    if (!conclusion) {
        return ServiceMessage::makeError(id, codeForEngineError(error), error);
    }
    return ServiceMessage::makeResponse(id, conclusion->toJson());
}

QJsonObject GovernanceService::handlePromoteModel(const QJsonValue& id, const QJsonObject& params)
{
    QString versionId;
    QString error;
    if (!requireString(params, QStringLiteral("model_version"), &versionId, &error)) {
        return ServiceMessage::makeError(id, ServiceErrorCode::InvalidParams, error);
    }
    if (!m_engine->promote(versionId, &error)) {
        return ServiceMessage::makeError(id, codeForEngineError(error), error);
    }
    QJsonObject result;
    result[QStringLiteral("active_versions")] = m_engine->registry().activeVersionsJson();
    return ServiceMessage::makeResponse(id, result);
}

} // namespace vd
