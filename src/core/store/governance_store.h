#pragma once

#include "core/store/record_store.h"

#include <QString>

#include <memory>
#include <mutex>
#include <optional>

#include <sqlite3.h>

namespace vd {

// GovernanceStore -- SQLite-backed prediction log, feedback store, correction
// store and drift history. Safe to share between threads; every statement
// sequence runs under one connection mutex.
class GovernanceStore : public PredictionLog,
                        public FeedbackStore,
                        public CorrectionStore,
                        public DriftHistoryStore {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Use open().
    explicit GovernanceStore(PrivateTag);
    ~GovernanceStore() override;

    GovernanceStore(const GovernanceStore&) = delete;
    GovernanceStore& operator=(const GovernanceStore&) = delete;

    // Open or create the database at the given path (":memory:" allowed).
    static std::unique_ptr<GovernanceStore> open(const QString& dbPath);

    bool appendPrediction(const PredictionRecord& record, QString* errorOut = nullptr) override;
    std::optional<PredictionRecord> findPrediction(const QString& requestId) override;
    bool featureWindow(const QString& modelVersion,
                       const QDateTime& from,
                       const QDateTime& to,
                       int limit,
                       std::vector<FeatureArray>* out,
                       QString* errorOut = nullptr) override;

    bool appendFeedback(const FeedbackRecord& record, QString* errorOut = nullptr) override;
    bool appendCorrection(const CorrectionRecord& record, QString* errorOut = nullptr) override;

    bool appendDriftResult(const DriftDetectionResult& result, QString* errorOut = nullptr) override;
    std::vector<DriftDetectionResult> driftHistory(const QString& modelVersion, int limit) override;

    // Deletes prediction and feedback rows whose expiry is at or before now.
    // Returns the number of rows removed.
    std::optional<int> pruneExpired(const QDateTime& now);

    qint64 rowCount(const char* table);

private:
    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    QString lastError() const;

    sqlite3* m_db = nullptr;
    std::mutex m_mutex;
};

} // namespace vd
