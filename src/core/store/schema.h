#pragma once

namespace nr {

// Per-connection pragmas, applied on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas, applied once when the database is created.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x4E52;
PRAGMA user_version = 1;
)";

// Schema v1. Timestamps are INTEGER milliseconds since the Unix epoch (UTC).
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT
);

CREATE TABLE IF NOT EXISTS experiment (
    key TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    description TEXT,
    start_at INTEGER,
    end_at INTEGER,
    is_active INTEGER NOT NULL DEFAULT 0,
    auto_stop_enabled INTEGER NOT NULL DEFAULT 1,
    auto_stop_threshold REAL NOT NULL DEFAULT 0.05,
    min_sample_size INTEGER NOT NULL DEFAULT 1000,
    stop_reason TEXT,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_experiment_active ON experiment(is_active);

CREATE TABLE IF NOT EXISTS experiment_variant (
    experiment_key TEXT NOT NULL REFERENCES experiment(key) ON DELETE CASCADE,
    ordinal INTEGER NOT NULL,
    name TEXT NOT NULL,
    percentage INTEGER NOT NULL,
    PRIMARY KEY (experiment_key, ordinal)
);

CREATE TABLE IF NOT EXISTS experiment_alert (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    experiment_key TEXT NOT NULL REFERENCES experiment(key),
    alert_type TEXT NOT NULL,
    control_ctr REAL NOT NULL DEFAULT 0,
    treatment_ctr REAL NOT NULL DEFAULT 0,
    degradation REAL NOT NULL DEFAULT 0,
    threshold REAL NOT NULL DEFAULT 0,
    degraded_dates TEXT NOT NULL DEFAULT '[]',
    message TEXT,
    resolved INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    resolved_at INTEGER
);

CREATE INDEX IF NOT EXISTS idx_experiment_alert_open ON experiment_alert(resolved, created_at DESC);

CREATE TABLE IF NOT EXISTS user_profile (
    subject_id TEXT PRIMARY KEY,
    interested_tickers TEXT NOT NULL DEFAULT '[]',
    interested_keywords TEXT NOT NULL DEFAULT '[]',
    diversity_weight REAL NOT NULL DEFAULT 0.7,
    personalization_enabled INTEGER NOT NULL DEFAULT 0,
    is_active INTEGER NOT NULL DEFAULT 1,
    updated_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS impression_log (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    subject_id TEXT NOT NULL,
    item_id TEXT NOT NULL,
    session_id TEXT,
    page_type TEXT,
    position INTEGER NOT NULL,
    experiment_key TEXT,
    variant TEXT,
    importance_score REAL,
    rank_score REAL,
    personalized INTEGER NOT NULL DEFAULT 0,
    diversity_applied INTEGER NOT NULL DEFAULT 0,
    timestamp INTEGER NOT NULL,
    date_partition TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_impression_experiment_day
    ON impression_log(experiment_key, date_partition, variant);
CREATE INDEX IF NOT EXISTS idx_impression_subject ON impression_log(subject_id, timestamp);

CREATE TABLE IF NOT EXISTS click_log (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    subject_id TEXT NOT NULL,
    item_id TEXT NOT NULL,
    session_id TEXT,
    position INTEGER,
    experiment_key TEXT,
    variant TEXT,
    dwell_time_ms INTEGER,
    item_tickers TEXT NOT NULL DEFAULT '[]',
    topic_id TEXT,
    timestamp INTEGER NOT NULL,
    date_partition TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_click_experiment_day
    ON click_log(experiment_key, date_partition, variant);
CREATE INDEX IF NOT EXISTS idx_click_subject ON click_log(subject_id, timestamp);

CREATE TABLE IF NOT EXISTS bandit_arm (
    arm_id INTEGER PRIMARY KEY,
    name TEXT NOT NULL UNIQUE,
    reward_count INTEGER NOT NULL DEFAULT 0,
    reward_sum REAL NOT NULL DEFAULT 0,
    reward_sum_squared REAL NOT NULL DEFAULT 0,
    enabled INTEGER NOT NULL DEFAULT 1,
    updated_at INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS bandit_decision (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    arm_id INTEGER NOT NULL REFERENCES bandit_arm(arm_id),
    subject_id TEXT NOT NULL,
    context TEXT NOT NULL DEFAULT '{}',
    decision_value REAL NOT NULL DEFAULT 0,
    selection_reason TEXT NOT NULL,
    served_item_ids TEXT NOT NULL DEFAULT '[]',
    created_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_bandit_decision_subject ON bandit_decision(subject_id, created_at);

CREATE TABLE IF NOT EXISTS bandit_reward (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    decision_id INTEGER NOT NULL REFERENCES bandit_decision(id),
    reward_type TEXT NOT NULL,
    reward_value REAL NOT NULL,
    item_id TEXT,
    created_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_bandit_reward_decision ON bandit_reward(decision_id);

CREATE TABLE IF NOT EXISTS experiment_metrics_daily (
    experiment_key TEXT NOT NULL,
    variant TEXT NOT NULL,
    date_partition TEXT NOT NULL,
    impressions INTEGER NOT NULL DEFAULT 0,
    clicks INTEGER NOT NULL DEFAULT 0,
    unique_users INTEGER NOT NULL DEFAULT 0,
    ctr REAL NOT NULL DEFAULT 0,
    avg_dwell_time_ms REAL NOT NULL DEFAULT 0,
    avg_position REAL NOT NULL DEFAULT 0,
    hide_rate REAL NOT NULL DEFAULT 0,
    diversity_score REAL NOT NULL DEFAULT 0,
    personalization_score REAL NOT NULL DEFAULT 0,
    is_final INTEGER NOT NULL DEFAULT 0,
    updated_at INTEGER NOT NULL,
    PRIMARY KEY (experiment_key, variant, date_partition)
);

CREATE TABLE IF NOT EXISTS embedding (
    ref TEXT PRIMARY KEY,
    dimensions INTEGER NOT NULL,
    vector BLOB NOT NULL,
    updated_at INTEGER NOT NULL
);
)";

// Arms the bandit starts with; ids are stable across restarts.
constexpr const char* kDefaultArms = R"(
INSERT OR IGNORE INTO bandit_arm (arm_id, name) VALUES (1, 'personalized');
INSERT OR IGNORE INTO bandit_arm (arm_id, name) VALUES (2, 'popular');
INSERT OR IGNORE INTO bandit_arm (arm_id, name) VALUES (3, 'diverse');
INSERT OR IGNORE INTO bandit_arm (arm_id, name) VALUES (4, 'recent');
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
INSERT OR IGNORE INTO settings (key, value) VALUES ('last_aggregation_at', '0');
INSERT OR IGNORE INTO settings (key, value) VALUES ('last_auto_stop_check_at', '0');
)";

constexpr int kCurrentSchemaVersion = 2;

} // namespace nr
