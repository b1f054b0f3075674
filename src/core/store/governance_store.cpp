#include "core/store/governance_store.h"
#include "core/store/schema.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTimeZone>

#include <cstring>

namespace vd {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

void bindText(sqlite3_stmt* stmt, int index, const QString& value)
{
    if (value.isNull()) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    const QByteArray utf8 = value.toUtf8();
    sqlite3_bind_text(stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
}

QString columnText(sqlite3_stmt* stmt, int column)
{
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) {
        return QString();
    }
    return QString::fromUtf8(reinterpret_cast<const char*>(text), sqlite3_column_bytes(stmt, column));
}

qint64 toMs(const QDateTime& dt)
{
    return dt.isValid() ? dt.toMSecsSinceEpoch() : QDateTime::currentMSecsSinceEpoch();
}

QString compactJson(const QJsonObject& obj)
{
    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

QString featureArrayJson(const FeatureArray& values)
{
    QJsonArray arr;
    for (double value : values) {
        arr.append(value);
    }
    return QString::fromUtf8(QJsonDocument(arr).toJson(QJsonDocument::Compact));
}

bool parseFeatureArray(const QString& text, FeatureArray* out)
{
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8());
    const QJsonArray arr = doc.array();
    if (!doc.isArray() || arr.size() != kFeatureDim) {
        return false;
    }
    for (int i = 0; i < kFeatureDim; ++i) {
        (*out)[static_cast<size_t>(i)] = arr.at(i).toDouble();
    }
    return true;
}

} // namespace

GovernanceStore::GovernanceStore(PrivateTag)
{
}

GovernanceStore::~GovernanceStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<GovernanceStore> GovernanceStore::open(const QString& dbPath)
{
    auto store = std::make_unique<GovernanceStore>(PrivateTag{});
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool GovernanceStore::init(const QString& dbPath)
{
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(vdStore, "Failed to open database %s: %s",
                  qUtf8Printable(dbPath), m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(vdStore, "Failed to set connection pragmas");
        return false;
    }

    // WAL is not available for in-memory databases; the pragma is a no-op there.
    if (!execSql(kDatabasePragmas)) {
        LOG_ERROR(vdStore, "Failed to set database pragmas");
        return false;
    }

    if (!execSql(kSchemaV1)) {
        LOG_ERROR(vdStore, "Failed to create schema");
        return false;
    }

    if (dbPath != QLatin1String(":memory:")) {
        QFile dbFile(dbPath);
        dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);
    }
    return true;
}

bool GovernanceStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(vdStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

QString GovernanceStore::lastError() const
{
    return QString::fromUtf8(sqlite3_errmsg(m_db));
}

// ── Prediction log ──────────────────────────────────────────

bool GovernanceStore::appendPrediction(const PredictionRecord& record, QString* errorOut)
{
    static const char* kSql = R"(
        INSERT INTO predictions (request_id, model_version, decision, confidence, user_id,
                                 session_id, ab_test_id, ab_cohort, features, response,
                                 created_at, expires_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)
    )";

    const GovernanceResponse& response = record.response;
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError(errorOut, lastError());
        return false;
    }

    bindText(stmt, 1, response.requestId);
    bindText(stmt, 2, response.modelVersion);
    bindText(stmt, 3, decisionToString(response.decision));
    sqlite3_bind_double(stmt, 4, response.confidence);
    bindText(stmt, 5, record.userId);
    bindText(stmt, 6, record.sessionId);
    bindText(stmt, 7, response.abTest ? response.abTest->testId : QString());
    bindText(stmt, 8, response.abTest ? abCohortToString(response.abTest->cohort) : QString());
    bindText(stmt, 9, featureArrayJson(response.features.toArray()));
    bindText(stmt, 10, compactJson(response.toJson()));
    sqlite3_bind_int64(stmt, 11, toMs(record.createdAt));
    sqlite3_bind_int64(stmt, 12, toMs(record.expiresAt));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        setError(errorOut, lastError());
        LOG_WARN(vdStore, "Failed to log prediction %s: %s",
                 qUtf8Printable(response.requestId), sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<PredictionRecord> GovernanceStore::findPrediction(const QString& requestId)
{
    static const char* kSql = R"(
        SELECT response, user_id, session_id, created_at, expires_at
        FROM predictions
        WHERE request_id = ?1 AND expires_at > ?2
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(vdStore, "Failed to prepare prediction lookup: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    bindText(stmt, 1, requestId);
    sqlite3_bind_int64(stmt, 2, QDateTime::currentMSecsSinceEpoch());

    std::optional<PredictionRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const QJsonDocument doc = QJsonDocument::fromJson(columnText(stmt, 0).toUtf8());
        std::optional<GovernanceResponse> response = GovernanceResponse::fromJson(doc.object());
        if (response) {
            PredictionRecord found;
            found.response = *response;
            found.userId = columnText(stmt, 1);
            found.sessionId = columnText(stmt, 2);
            found.createdAt = QDateTime::fromMSecsSinceEpoch(sqlite3_column_int64(stmt, 3), QTimeZone::utc());
            found.expiresAt = QDateTime::fromMSecsSinceEpoch(sqlite3_column_int64(stmt, 4), QTimeZone::utc());
            record = found;
        } else {
            LOG_WARN(vdStore, "Logged response for %s is unreadable", qUtf8Printable(requestId));
        }
    }
    sqlite3_finalize(stmt);
    return record;
}

bool GovernanceStore::featureWindow(const QString& modelVersion,
                                    const QDateTime& from,
                                    const QDateTime& to,
                                    int limit,
                                    std::vector<FeatureArray>* out,
                                    QString* errorOut)
{
    static const char* kSql = R"(
        SELECT features
        FROM predictions
        WHERE model_version = ?1 AND created_at >= ?2 AND created_at < ?3 AND expires_at > ?4
        ORDER BY created_at DESC
        LIMIT ?5
    )";

    if (!out) {
        setError(errorOut, QStringLiteral("null_output"));
        return false;
    }
    out->clear();

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError(errorOut, lastError());
        return false;
    }
    bindText(stmt, 1, modelVersion);
    sqlite3_bind_int64(stmt, 2, toMs(from));
    sqlite3_bind_int64(stmt, 3, toMs(to));
    sqlite3_bind_int64(stmt, 4, QDateTime::currentMSecsSinceEpoch());
    sqlite3_bind_int(stmt, 5, limit > 0 ? limit : -1);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        FeatureArray values{};
        if (parseFeatureArray(columnText(stmt, 0), &values)) {
            out->push_back(values);
        }
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        setError(errorOut, lastError());
        return false;
    }
    return true;
}

// ── Feedback & corrections ──────────────────────────────────

bool GovernanceStore::appendFeedback(const FeedbackRecord& record, QString* errorOut)
{
    static const char* kSql = R"(
        INSERT INTO feedback (request_id, user_id, feedback_type, correct_decision,
                              logged_decision, model_version, rationale, severity,
                              metadata, created_at, expires_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
    )";

    const FeedbackSubmission& fb = record.feedback;
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError(errorOut, lastError());
        return false;
    }

    bindText(stmt, 1, fb.requestId);
    bindText(stmt, 2, fb.userId);
    bindText(stmt, 3, feedbackTypeToString(fb.feedbackType));
    bindText(stmt, 4, fb.correctDecision ? decisionToString(*fb.correctDecision) : QString());
    bindText(stmt, 5, decisionToString(record.loggedDecision));
    bindText(stmt, 6, record.modelVersion);
    bindText(stmt, 7, fb.rationale);
    bindText(stmt, 8, fb.severity);
    bindText(stmt, 9, compactJson(fb.metadata));
    sqlite3_bind_int64(stmt, 10, toMs(fb.submittedAt));
    sqlite3_bind_int64(stmt, 11, toMs(record.expiresAt));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        setError(errorOut, lastError());
        return false;
    }
    return true;
}

bool GovernanceStore::appendCorrection(const CorrectionRecord& record, QString* errorOut)
{
    static const char* kSql = R"(
        INSERT INTO corrections (request_id, model_version, original_decision,
                                 corrected_decision, feedback_type, user_id, rationale,
                                 features, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError(errorOut, lastError());
        return false;
    }

    bindText(stmt, 1, record.requestId);
    bindText(stmt, 2, record.modelVersion);
    bindText(stmt, 3, decisionToString(record.originalDecision));
    bindText(stmt, 4, decisionToString(record.correctedDecision));
    bindText(stmt, 5, feedbackTypeToString(record.feedbackType));
    bindText(stmt, 6, record.userId);
    bindText(stmt, 7, record.rationale);
    bindText(stmt, 8, compactJson(record.features.toJson()));
    sqlite3_bind_int64(stmt, 9, toMs(record.createdAt));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        setError(errorOut, lastError());
        return false;
    }
    return true;
}

// ── Drift history ───────────────────────────────────────────

bool GovernanceStore::appendDriftResult(const DriftDetectionResult& result, QString* errorOut)
{
    static const char* kSql = R"(
        INSERT INTO drift_checks (check_id, model_version, drift_detected, drift_score,
                                  threshold, result, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
    )";

    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError(errorOut, lastError());
        return false;
    }

    bindText(stmt, 1, result.checkId);
    bindText(stmt, 2, result.modelVersion);
    sqlite3_bind_int(stmt, 3, result.driftDetected ? 1 : 0);
    sqlite3_bind_double(stmt, 4, result.driftScore);
    sqlite3_bind_double(stmt, 5, result.threshold);
    bindText(stmt, 6, compactJson(result.toJson()));
    sqlite3_bind_int64(stmt, 7, toMs(result.timestamp));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        setError(errorOut, lastError());
        return false;
    }
    return true;
}

std::vector<DriftDetectionResult> GovernanceStore::driftHistory(const QString& modelVersion, int limit)
{
    static const char* kSql = R"(
        SELECT result
        FROM drift_checks
        WHERE (?1 IS NULL OR model_version = ?1)
        ORDER BY created_at DESC, rowid DESC
        LIMIT ?2
    )";

    std::vector<DriftDetectionResult> out;
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kSql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(vdStore, "Failed to prepare drift history query: %s", sqlite3_errmsg(m_db));
        return out;
    }
    bindText(stmt, 1, modelVersion.isEmpty() ? QString() : modelVersion);
    sqlite3_bind_int(stmt, 2, limit > 0 ? limit : -1);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const QJsonDocument doc = QJsonDocument::fromJson(columnText(stmt, 0).toUtf8());
        if (std::optional<DriftDetectionResult> parsed = DriftDetectionResult::fromJson(doc.object())) {
            out.push_back(*parsed);
        }
    }
    sqlite3_finalize(stmt);
    return out;
}

// ── Maintenance ─────────────────────────────────────────────

std::optional<int> GovernanceStore::pruneExpired(const QDateTime& now)
{
    static const char* kTables[] = {"predictions", "feedback"};

    std::lock_guard<std::mutex> lock(m_mutex);
    int removed = 0;
    for (const char* table : kTables) {
        const QByteArray sql = QByteArrayLiteral("DELETE FROM ") + table
                             + QByteArrayLiteral(" WHERE expires_at <= ?1");
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_WARN(vdStore, "Failed to prepare prune of %s: %s", table, sqlite3_errmsg(m_db));
            return std::nullopt;
        }
        sqlite3_bind_int64(stmt, 1, toMs(now));
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_WARN(vdStore, "Failed to prune %s: %s", table, sqlite3_errmsg(m_db));
            return std::nullopt;
        }
        removed += sqlite3_changes(m_db);
    }

    if (removed > 0) {
        LOG_INFO(vdStore, "Pruned %d expired rows", removed);
    }
    return removed;
}

qint64 GovernanceStore::rowCount(const char* table)
{
    static const char* kAllowed[] = {"predictions", "feedback", "corrections", "drift_checks"};
    bool allowed = false;
    for (const char* name : kAllowed) {
        if (std::strcmp(name, table) == 0) {
            allowed = true;
            break;
        }
    }
    if (!allowed) {
        return -1;
    }

    const QByteArray sql = QByteArrayLiteral("SELECT count(*) FROM ") + table;
    std::lock_guard<std::mutex> lock(m_mutex);
    sqlite3_stmt* stmt = nullptr;
    qint64 count = -1;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace vd
