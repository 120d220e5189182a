#include "core/experiment/feature_flags.h"
#include "core/store/sql_helpers.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QVector>

#include <algorithm>

#include <sqlite3.h>

namespace nr {

FeatureFlags::FeatureFlags(sqlite3* db, int ttlSeconds)
    : m_db(db)
    , m_ttl(std::max(0, ttlSeconds))
{
}

bool FeatureFlags::reload()
{
    const char* sqlText = "SELECT key, enabled, value, description FROM feature_flag";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrExperiment, "Failed to load feature flags: %s", sqlite3_errmsg(m_db));
        return false;
    }

    QHash<QString, FeatureFlag> loaded;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        FeatureFlag flag;
        flag.key = sql::columnText(stmt, 0);
        flag.enabled = sqlite3_column_int(stmt, 1) != 0;
        flag.value = sql::columnOptionalText(stmt, 2);
        flag.description = sql::columnText(stmt, 3);
        loaded.insert(flag.key, flag);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrExperiment, "Feature flag scan failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    m_flags = std::move(loaded);
    m_loadedAt = std::chrono::steady_clock::now();
    m_loaded = true;
    return true;
}

bool FeatureFlags::ensureLoaded()
{
    if (m_loaded && std::chrono::steady_clock::now() - m_loadedAt < m_ttl) {
        return true;
    }
    // A failed reload keeps serving the last snapshot.
    return reload() || m_loaded;
}

bool FeatureFlags::isEnabled(const QString& key, bool defaultValue)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureLoaded()) {
        return defaultValue;
    }
    auto it = m_flags.constFind(key);
    return it == m_flags.constEnd() ? defaultValue : it->enabled;
}

double FeatureFlags::numberValue(const QString& key, double defaultValue)
{
    return numberValue(key).value_or(defaultValue);
}

std::optional<double> FeatureFlags::numberValue(const QString& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureLoaded()) {
        return std::nullopt;
    }
    auto it = m_flags.constFind(key);
    if (it == m_flags.constEnd() || !it->enabled || !it->value.has_value()) {
        return std::nullopt;
    }
    bool ok = false;
    const double number = it->value->toDouble(&ok);
    if (!ok) {
        LOG_WARN(nrExperiment, "Feature flag %s has non-numeric value '%s'",
                 qUtf8Printable(key), qUtf8Printable(*it->value));
        return std::nullopt;
    }
    return number;
}

std::optional<FeatureFlag> FeatureFlags::get(const QString& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureLoaded()) {
        return std::nullopt;
    }
    auto it = m_flags.constFind(key);
    if (it == m_flags.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

QVector<FeatureFlag> FeatureFlags::list()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QVector<FeatureFlag> result;
    if (!ensureLoaded()) {
        return result;
    }
    for (auto it = m_flags.constBegin(); it != m_flags.constEnd(); ++it) {
        result.append(it.value());
    }
    std::sort(result.begin(), result.end(), [](const FeatureFlag& a, const FeatureFlag& b) {
        return a.key < b.key;
    });
    return result;
}

bool FeatureFlags::upsert(const FeatureFlag& flag)
{
    const char* sqlText = R"(
        INSERT INTO feature_flag (key, enabled, value, description, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5)
        ON CONFLICT(key) DO UPDATE SET
            enabled = excluded.enabled,
            value = excluded.value,
            updated_at = excluded.updated_at
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sqlText, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(nrExperiment, "Failed to prepare feature flag upsert: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, flag.key);
    sqlite3_bind_int(stmt, 2, flag.enabled ? 1 : 0);
    sql::bindOptionalText(stmt, 3, flag.value);
    sql::bindText(stmt, 4, flag.description);
    sqlite3_bind_int64(stmt, 5, sql::toEpochMs(QDateTime::currentDateTimeUtc()));

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_ERROR(nrExperiment, "Failed to write feature flag %s: %s",
                  qUtf8Printable(flag.key), sqlite3_errmsg(m_db));
        return false;
    }
    m_flags.insert(flag.key, flag);
    return true;
}

bool FeatureFlags::setEnabled(const QString& key, bool enabled)
{
    if (key.trimmed().isEmpty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureLoaded()) {
        LOG_WARN(nrExperiment, "Writing flag %s without a loaded snapshot", qUtf8Printable(key));
    }
    FeatureFlag flag = m_flags.value(key, FeatureFlag{key, true, std::nullopt, QString()});
    flag.enabled = enabled;
    if (!upsert(flag)) {
        return false;
    }
    LOG_INFO(nrExperiment, "Feature flag %s %s", qUtf8Printable(key),
             enabled ? "enabled" : "disabled");
    return true;
}

bool FeatureFlags::setValue(const QString& key, const std::optional<QString>& value)
{
    if (key.trimmed().isEmpty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureLoaded()) {
        LOG_WARN(nrExperiment, "Writing flag %s without a loaded snapshot", qUtf8Printable(key));
    }
    FeatureFlag flag = m_flags.value(key, FeatureFlag{key, true, std::nullopt, QString()});
    flag.value = value;
    return upsert(flag);
}

void FeatureFlags::invalidate()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loaded = false;
    m_flags.clear();
}

} // namespace nr
