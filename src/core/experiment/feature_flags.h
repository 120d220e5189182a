#pragma once

#include <QHash>
#include <QString>
#include <QVector>

#include <chrono>
#include <mutex>
#include <optional>

struct sqlite3;

namespace nr {

namespace flags {
constexpr const char* kRankAb = "experiment.rank_ab.enabled";
constexpr const char* kPersonalization = "feature.personalization.enabled";
constexpr const char* kDiversityFilter = "feature.diversity_filter.enabled";
constexpr const char* kImpressionLogging = "analytics.impression_logging.enabled";
constexpr const char* kClickLogging = "analytics.click_logging.enabled";
constexpr const char* kMmrLambda = "config.mmr_lambda";
constexpr const char* kAutoStop = "experiment.auto_stop.enabled";
constexpr const char* kMetricsCalculation = "analytics.metrics_calculation.enabled";
} // namespace flags

struct FeatureFlag {
    QString key;
    bool enabled = true;
    std::optional<QString> value;
    QString description;
};

// FeatureFlags -- runtime switches stored in the feature_flag table.
//
// Reads go through an in-memory snapshot that is reloaded once it is older
// than the TTL; writes update the table and the snapshot together.
class FeatureFlags {
public:
    static constexpr int kDefaultTtlSeconds = 60;

    explicit FeatureFlags(sqlite3* db, int ttlSeconds = kDefaultTtlSeconds);

    // Unknown keys (or an unreadable table) report defaultValue.
    bool isEnabled(const QString& key, bool defaultValue = true);
    std::optional<double> numberValue(const QString& key);
    double numberValue(const QString& key, double defaultValue);
    std::optional<FeatureFlag> get(const QString& key);
    QVector<FeatureFlag> list();

    bool setEnabled(const QString& key, bool enabled);
    bool setValue(const QString& key, const std::optional<QString>& value);

    // Drops the snapshot; the next read reloads from the table.
    void invalidate();

private:
    bool ensureLoaded();
    bool reload();
    bool upsert(const FeatureFlag& flag);

    sqlite3* m_db = nullptr;
    std::chrono::seconds m_ttl;
    std::mutex m_mutex;
    QHash<QString, FeatureFlag> m_flags;
    std::chrono::steady_clock::time_point m_loadedAt;
    bool m_loaded = false;
};

} // namespace nr
