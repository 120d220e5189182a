#include "core/store/experiment_store.h"
#include "core/store/sql_helpers.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QSet>

#include <sqlite3.h>

namespace nr {

namespace {

constexpr const char* kExperimentColumns = R"(
    SELECT key, name, description, start_at, end_at, is_active, auto_stop_enabled,
           auto_stop_threshold, min_sample_size, stop_reason, created_at, updated_at
    FROM experiment
)";

ExperimentDefinition readExperimentRow(sqlite3_stmt* stmt)
{
    ExperimentDefinition definition;
    definition.key = sql::columnText(stmt, 0);
    definition.name = sql::columnText(stmt, 1);
    definition.description = sql::columnText(stmt, 2);
    definition.startAt = sql::columnTimestamp(stmt, 3);
    definition.endAt = sql::columnTimestamp(stmt, 4);
    definition.isActive = sqlite3_column_int(stmt, 5) != 0;
    definition.autoStopEnabled = sqlite3_column_int(stmt, 6) != 0;
    definition.autoStopThreshold = sqlite3_column_double(stmt, 7);
    definition.minSampleSize = sqlite3_column_int64(stmt, 8);
    definition.stopReason = sql::columnText(stmt, 9);
    definition.createdAt = sql::columnTimestamp(stmt, 10);
    definition.updatedAt = sql::columnTimestamp(stmt, 11);
    return definition;
}

ExperimentAlert readAlertRow(sqlite3_stmt* stmt)
{
    ExperimentAlert alert;
    alert.id = sqlite3_column_int64(stmt, 0);
    alert.experimentKey = sql::columnText(stmt, 1);
    alert.alertType = sql::columnText(stmt, 2);
    alert.controlCtr = sqlite3_column_double(stmt, 3);
    alert.treatmentCtr = sqlite3_column_double(stmt, 4);
    alert.degradation = sqlite3_column_double(stmt, 5);
    alert.threshold = sqlite3_column_double(stmt, 6);
    alert.degradedDates = sql::decodeStringList(sql::columnText(stmt, 7));
    alert.message = sql::columnText(stmt, 8);
    alert.resolved = sqlite3_column_int(stmt, 9) != 0;
    alert.createdAt = sql::columnTimestamp(stmt, 10);
    alert.resolvedAt = sql::columnTimestamp(stmt, 11);
    return alert;
}

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

ExperimentStore::ExperimentStore(sqlite3* db)
    : m_db(db)
{
}

bool ExperimentStore::validate(const ExperimentDefinition& definition, QString* errorOut)
{
    if (definition.key.trimmed().isEmpty()) {
        setError(errorOut, QStringLiteral("Experiment key must not be empty"));
        return false;
    }
    if (definition.orderedVariants.isEmpty()) {
        setError(errorOut, QStringLiteral("Experiment needs at least one variant"));
        return false;
    }

    QSet<QString> names;
    for (const VariantAllocation& allocation : definition.orderedVariants) {
        if (allocation.name.trimmed().isEmpty()) {
            setError(errorOut, QStringLiteral("Variant names must not be empty"));
            return false;
        }
        if (names.contains(allocation.name)) {
            setError(errorOut, QStringLiteral("Duplicate variant '%1'").arg(allocation.name));
            return false;
        }
        names.insert(allocation.name);
        if (allocation.percentage < 0 || allocation.percentage > 100) {
            setError(errorOut, QStringLiteral("Variant '%1' has percentage %2 outside [0,100]")
                                   .arg(allocation.name)
                                   .arg(allocation.percentage));
            return false;
        }
    }

    if (definition.totalPercentage() != 100) {
        setError(errorOut, QStringLiteral("Variant percentages sum to %1, expected 100")
                               .arg(definition.totalPercentage()));
        return false;
    }

    if (definition.startAt.isValid() && definition.endAt.isValid()
        && definition.endAt < definition.startAt) {
        setError(errorOut, QStringLiteral("endAt precedes startAt"));
        return false;
    }
    if (definition.autoStopThreshold < 0.0 || definition.minSampleSize < 0) {
        setError(errorOut, QStringLiteral("Auto-stop threshold and sample size must be non-negative"));
        return false;
    }
    return true;
}

bool ExperimentStore::create(const ExperimentDefinition& definition, QString* errorOut)
{
    if (!validate(definition, errorOut)) {
        return false;
    }

    if (!sql::exec(m_db, "BEGIN IMMEDIATE")) {
        setError(errorOut, QStringLiteral("Could not start transaction"));
        return false;
    }

    const char* sql = R"(
        INSERT INTO experiment (key, name, description, start_at, end_at, is_active,
                                auto_stop_enabled, auto_stop_threshold, min_sample_size,
                                created_at, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?10)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "create experiment prepare failed: %s", sqlite3_errmsg(m_db));
        sql::exec(m_db, "ROLLBACK");
        setError(errorOut, QStringLiteral("Storage failure"));
        return false;
    }

    const QString name = definition.name.isEmpty() ? definition.key : definition.name;
    sql::bindText(stmt, 1, definition.key);
    sql::bindText(stmt, 2, name);
    sql::bindText(stmt, 3, definition.description);
    sql::bindTimestamp(stmt, 4, definition.startAt);
    sql::bindTimestamp(stmt, 5, definition.endAt);
    sqlite3_bind_int(stmt, 6, definition.isActive ? 1 : 0);
    sqlite3_bind_int(stmt, 7, definition.autoStopEnabled ? 1 : 0);
    sqlite3_bind_double(stmt, 8, definition.autoStopThreshold);
    sqlite3_bind_int64(stmt, 9, definition.minSampleSize);
    sqlite3_bind_int64(stmt, 10, QDateTime::currentMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        const bool duplicate = sqlite3_extended_errcode(m_db) == SQLITE_CONSTRAINT_PRIMARYKEY;
        LOG_WARN(nrStore, "create experiment '%s' failed: %s",
                 qUtf8Printable(definition.key), sqlite3_errmsg(m_db));
        sql::exec(m_db, "ROLLBACK");
        setError(errorOut, duplicate
                               ? QStringLiteral("Experiment '%1' already exists").arg(definition.key)
                               : QStringLiteral("Storage failure"));
        return false;
    }

    if (!writeVariants(definition) || !sql::exec(m_db, "COMMIT")) {
        sql::exec(m_db, "ROLLBACK");
        setError(errorOut, QStringLiteral("Storage failure"));
        return false;
    }

    return true;
}

bool ExperimentStore::update(const ExperimentDefinition& definition, QString* errorOut)
{
    if (!validate(definition, errorOut)) {
        return false;
    }

    if (!sql::exec(m_db, "BEGIN IMMEDIATE")) {
        setError(errorOut, QStringLiteral("Could not start transaction"));
        return false;
    }

    const char* sql = R"(
        UPDATE experiment SET name = ?2, description = ?3, start_at = ?4, end_at = ?5,
               is_active = ?6, auto_stop_enabled = ?7, auto_stop_threshold = ?8,
               min_sample_size = ?9, updated_at = ?10
        WHERE key = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "update experiment prepare failed: %s", sqlite3_errmsg(m_db));
        sql::exec(m_db, "ROLLBACK");
        setError(errorOut, QStringLiteral("Storage failure"));
        return false;
    }
    sql::bindText(stmt, 1, definition.key);
    sql::bindText(stmt, 2, definition.name.isEmpty() ? definition.key : definition.name);
    sql::bindText(stmt, 3, definition.description);
    sql::bindTimestamp(stmt, 4, definition.startAt);
    sql::bindTimestamp(stmt, 5, definition.endAt);
    sqlite3_bind_int(stmt, 6, definition.isActive ? 1 : 0);
    sqlite3_bind_int(stmt, 7, definition.autoStopEnabled ? 1 : 0);
    sqlite3_bind_double(stmt, 8, definition.autoStopThreshold);
    sqlite3_bind_int64(stmt, 9, definition.minSampleSize);
    sqlite3_bind_int64(stmt, 10, QDateTime::currentMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE || sqlite3_changes(m_db) == 0) {
        sql::exec(m_db, "ROLLBACK");
        setError(errorOut, rc == SQLITE_DONE
                               ? QStringLiteral("Experiment '%1' not found").arg(definition.key)
                               : QStringLiteral("Storage failure"));
        return false;
    }

    if (!writeVariants(definition) || !sql::exec(m_db, "COMMIT")) {
        sql::exec(m_db, "ROLLBACK");
        setError(errorOut, QStringLiteral("Storage failure"));
        return false;
    }
    return true;
}

bool ExperimentStore::writeVariants(const ExperimentDefinition& definition)
{
    sqlite3_stmt* clear = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM experiment_variant WHERE experiment_key = ?1",
                           -1, &clear, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "variant clear prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(clear, 1, definition.key);
    const int clearRc = sqlite3_step(clear);
    sqlite3_finalize(clear);
    if (clearRc != SQLITE_DONE) {
        return false;
    }

    const char* sql = R"(
        INSERT INTO experiment_variant (experiment_key, ordinal, name, percentage)
        VALUES (?1, ?2, ?3, ?4)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "variant insert prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }

    bool ok = true;
    for (int i = 0; i < definition.orderedVariants.size(); ++i) {
        const VariantAllocation& allocation = definition.orderedVariants.at(i);
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        sql::bindText(stmt, 1, definition.key);
        sqlite3_bind_int(stmt, 2, i);
        sql::bindText(stmt, 3, allocation.name);
        sqlite3_bind_int(stmt, 4, allocation.percentage);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            LOG_WARN(nrStore, "variant insert failed: %s", sqlite3_errmsg(m_db));
            ok = false;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return ok;
}

bool ExperimentStore::loadVariants(ExperimentDefinition& definition)
{
    const char* sql = R"(
        SELECT name, percentage FROM experiment_variant
        WHERE experiment_key = ?1 ORDER BY ordinal ASC
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "loadVariants prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, definition.key);

    definition.orderedVariants.clear();
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        VariantAllocation allocation;
        allocation.name = sql::columnText(stmt, 0);
        allocation.percentage = sqlite3_column_int(stmt, 1);
        definition.orderedVariants.append(allocation);
    }
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::optional<ExperimentDefinition> ExperimentStore::get(const QString& key)
{
    const QString sql = QString::fromUtf8(kExperimentColumns) + QStringLiteral(" WHERE key = ?1");
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.toUtf8().constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "get experiment prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sql::bindText(stmt, 1, key);

    std::optional<ExperimentDefinition> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = readExperimentRow(stmt);
    }
    sqlite3_finalize(stmt);

    if (result && !loadVariants(*result)) {
        return std::nullopt;
    }
    return result;
}

QVector<ExperimentDefinition> ExperimentStore::query(const char* whereClause)
{
    QVector<ExperimentDefinition> rows;
    const QString sql = QString::fromUtf8(kExperimentColumns) + QLatin1Char(' ')
        + QString::fromUtf8(whereClause) + QStringLiteral(" ORDER BY created_at ASC, key ASC");
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql.toUtf8().constData(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "experiment query prepare failed: %s", sqlite3_errmsg(m_db));
        return rows;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.append(readExperimentRow(stmt));
    }
    sqlite3_finalize(stmt);

    QVector<ExperimentDefinition> loaded;
    loaded.reserve(rows.size());
    for (ExperimentDefinition& definition : rows) {
        if (loadVariants(definition)) {
            loaded.append(definition);
        } else {
            LOG_WARN(nrStore, "Skipping experiment '%s': variants unreadable",
                     qUtf8Printable(definition.key));
        }
    }
    return loaded;
}

QVector<ExperimentDefinition> ExperimentStore::listAll()
{
    return query("");
}

QVector<ExperimentDefinition> ExperimentStore::listActive()
{
    return query("WHERE is_active = 1");
}

QVector<ExperimentDefinition> ExperimentStore::listAutoStopEnabled()
{
    return query("WHERE is_active = 1 AND auto_stop_enabled = 1");
}

bool ExperimentStore::setActive(const QString& key, bool active, const QString* reason)
{
    const char* sql = R"(
        UPDATE experiment SET is_active = ?2, stop_reason = ?3, updated_at = ?4 WHERE key = ?1
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "setActive prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, key);
    sqlite3_bind_int(stmt, 2, active ? 1 : 0);
    if (reason) {
        sql::bindText(stmt, 3, *reason);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_int64(stmt, 4, QDateTime::currentMSecsSinceEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

bool ExperimentStore::activate(const QString& key)
{
    if (!setActive(key, true, nullptr)) {
        LOG_WARN(nrExperiment, "Failed to activate experiment '%s'", qUtf8Printable(key));
        return false;
    }
    LOG_INFO(nrExperiment, "Activated experiment '%s'", qUtf8Printable(key));
    return true;
}

bool ExperimentStore::stop(const QString& key, const QString& reason)
{
    if (!setActive(key, false, &reason)) {
        LOG_WARN(nrExperiment, "Failed to stop experiment '%s'", qUtf8Printable(key));
        return false;
    }
    LOG_INFO(nrExperiment, "Stopped experiment '%s': %s",
             qUtf8Printable(key), qUtf8Printable(reason));
    return true;
}

bool ExperimentStore::recordAssignment(const ExperimentAssignment& assignment)
{
    const char* sql = R"(
        INSERT OR IGNORE INTO experiment_assignment
            (subject_id, experiment_key, variant, bucket, assigned_at)
        VALUES (?1, ?2, ?3, ?4, ?5)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "recordAssignment prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sql::bindText(stmt, 1, assignment.subjectId);
    sql::bindText(stmt, 2, assignment.experimentKey);
    sql::bindText(stmt, 3, assignment.variant);
    sqlite3_bind_int(stmt, 4, assignment.bucket);
    sqlite3_bind_int64(stmt, 5, QDateTime::currentMSecsSinceEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

std::optional<ExperimentAssignment> ExperimentStore::findRecordedAssignment(
    const QString& subjectId, const QString& experimentKey)
{
    const char* sql = R"(
        SELECT variant, bucket FROM experiment_assignment
        WHERE subject_id = ?1 AND experiment_key = ?2
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sql::bindText(stmt, 1, subjectId);
    sql::bindText(stmt, 2, experimentKey);

    std::optional<ExperimentAssignment> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ExperimentAssignment assignment;
        assignment.subjectId = subjectId;
        assignment.experimentKey = experimentKey;
        assignment.variant = sql::columnText(stmt, 0);
        assignment.bucket = sqlite3_column_int(stmt, 1);
        assignment.isActive = true;
        result = assignment;
    }
    sqlite3_finalize(stmt);
    return result;
}

// ── Alerts ──────────────────────────────────────────────────

std::optional<int64_t> ExperimentStore::insertAlert(const ExperimentAlert& alert)
{
    const char* sql = R"(
        INSERT INTO experiment_alert (experiment_key, alert_type, control_ctr, treatment_ctr,
                                      degradation, threshold, degraded_dates, message,
                                      resolved, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, 0, ?9)
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "insertAlert prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    sql::bindText(stmt, 1, alert.experimentKey);
    sql::bindText(stmt, 2, alert.alertType);
    sqlite3_bind_double(stmt, 3, alert.controlCtr);
    sqlite3_bind_double(stmt, 4, alert.treatmentCtr);
    sqlite3_bind_double(stmt, 5, alert.degradation);
    sqlite3_bind_double(stmt, 6, alert.threshold);
    sql::bindText(stmt, 7, sql::encodeStringList(alert.degradedDates));
    sql::bindText(stmt, 8, alert.message);
    sqlite3_bind_int64(stmt, 9, alert.createdAt.isValid()
                                    ? alert.createdAt.toMSecsSinceEpoch()
                                    : QDateTime::currentMSecsSinceEpoch());

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LOG_WARN(nrStore, "insertAlert failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return static_cast<int64_t>(sqlite3_last_insert_rowid(m_db));
}

QVector<ExperimentAlert> ExperimentStore::listAlerts(bool unresolvedOnly)
{
    QVector<ExperimentAlert> alerts;
    const char* sql = unresolvedOnly
        ? R"(SELECT id, experiment_key, alert_type, control_ctr, treatment_ctr, degradation,
                    threshold, degraded_dates, message, resolved, created_at, resolved_at
             FROM experiment_alert WHERE resolved = 0 ORDER BY created_at DESC, id DESC)"
        : R"(SELECT id, experiment_key, alert_type, control_ctr, treatment_ctr, degradation,
                    threshold, degraded_dates, message, resolved, created_at, resolved_at
             FROM experiment_alert ORDER BY created_at DESC, id DESC)";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "listAlerts prepare failed: %s", sqlite3_errmsg(m_db));
        return alerts;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        alerts.append(readAlertRow(stmt));
    }
    sqlite3_finalize(stmt);
    return alerts;
}

bool ExperimentStore::resolveAlert(int64_t alertId)
{
    const char* sql = "UPDATE experiment_alert SET resolved = 1, resolved_at = ?2 "
                      "WHERE id = ?1 AND resolved = 0";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN(nrStore, "resolveAlert prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, alertId);
    sqlite3_bind_int64(stmt, 2, QDateTime::currentMSecsSinceEpoch());
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

} // namespace nr
