#pragma once

#include "core/engine/governance_engine.h"
#include "services/governance/service_message.h"

#include <QFile>
#include <QJsonObject>
#include <QObject>
#include <QSocketNotifier>
#include <QTimer>

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

namespace vd {

// GovernanceService -- request dispatch for the governance engine over
// newline-delimited JSON on stdin/stdout. Maintenance and scheduled drift
// checks are started by timers and run on a background thread, one job at a
// time, so they never hold up request handling.
class GovernanceService : public QObject {
    Q_OBJECT
public:
    explicit GovernanceService(GovernanceEngine* engine, QObject* parent = nullptr);
    ~GovernanceService() override;

    QJsonObject handleRequest(const QJsonObject& request);

    // Starts the stdin reader and the periodic timers.
    void start();
    // Stops the timers and waits for a running background job.
    void stop();

    // Starts job on the background thread. Returns false, without running
    // it, while a previous job is still in progress.
    bool runInBackground(const QString& name, std::function<void()> job);
    bool isBackgroundJobRunning() const { return m_backgroundRunning.load(); }
    void waitForBackgroundJob();

signals:
    void inputClosed();

public slots:
    void runMaintenance();
    void runScheduledDriftCheck();

private slots:
    void readInput();

private:
    QJsonObject handlePredict(const QJsonValue& id, const QJsonObject& params);
    QJsonObject handleSubmitFeedback(const QJsonValue& id, const QJsonObject& params);
    QJsonObject handleStatus(const QJsonValue& id);
    QJsonObject handleModelMetrics(const QJsonValue& id);
    QJsonObject handleDriftCheck(const QJsonValue& id, const QJsonObject& params);
    QJsonObject handleDriftHistory(const QJsonValue& id, const QJsonObject& params);
    QJsonObject handleAbTests(const QJsonValue& id);
    QJsonObject handleOnlineLearningStatus(const QJsonValue& id);
    QJsonObject handleCreateAbTest(const QJsonValue& id, const QJsonObject& params);
    QJsonObject handleConcludeAbTest(const QJsonValue& id, const QJsonObject& params);
    QJsonObject handlePromoteModel(const QJsonValue& id, const QJsonObject& params);

    void processLine(const QByteArray& line);
    void writeLine(const QJsonObject& json);

    GovernanceEngine* m_engine = nullptr;
    QFile m_stdout;
    QTimer m_maintenanceTimer;
    QTimer m_driftTimer;
    std::unique_ptr<QSocketNotifier> m_stdinNotifier;
    QByteArray m_inputBuffer;

    std::thread m_backgroundThread;
    std::atomic<bool> m_backgroundRunning{false};
};

} // namespace vd
