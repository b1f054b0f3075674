#pragma once

namespace vd {

constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA user_version = 1;
)";

// Timestamps are milliseconds since the Unix epoch (UTC).
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS predictions (
    request_id TEXT PRIMARY KEY,
    model_version TEXT NOT NULL,
    decision TEXT NOT NULL,
    confidence REAL NOT NULL,
    user_id TEXT,
    session_id TEXT,
    ab_test_id TEXT,
    ab_cohort TEXT,
    features TEXT NOT NULL,
    response TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    expires_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_predictions_version_time
    ON predictions(model_version, created_at);
CREATE INDEX IF NOT EXISTS idx_predictions_expires
    ON predictions(expires_at);

CREATE TABLE IF NOT EXISTS feedback (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    request_id TEXT NOT NULL,
    user_id TEXT,
    feedback_type TEXT NOT NULL,
    correct_decision TEXT,
    logged_decision TEXT NOT NULL,
    model_version TEXT NOT NULL,
    rationale TEXT,
    severity TEXT,
    metadata TEXT,
    created_at INTEGER NOT NULL,
    expires_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_feedback_request ON feedback(request_id);
CREATE INDEX IF NOT EXISTS idx_feedback_expires ON feedback(expires_at);

CREATE TABLE IF NOT EXISTS corrections (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    request_id TEXT NOT NULL,
    model_version TEXT NOT NULL,
    original_decision TEXT NOT NULL,
    corrected_decision TEXT NOT NULL,
    feedback_type TEXT NOT NULL,
    user_id TEXT,
    rationale TEXT,
    features TEXT NOT NULL,
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS drift_checks (
    check_id TEXT PRIMARY KEY,
    model_version TEXT NOT NULL,
    drift_detected INTEGER NOT NULL,
    drift_score REAL NOT NULL,
    threshold REAL NOT NULL,
    result TEXT NOT NULL,
    created_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_drift_version_time
    ON drift_checks(model_version, created_at);
)";

} // namespace vd
