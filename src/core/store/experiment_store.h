#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QVector>
#include <optional>

struct sqlite3;
struct sqlite3_stmt;

namespace nr {

// ExperimentStore -- CRUD for experiment definitions, their ordered traffic
// allocation, assignment audit rows and auto-stop alerts.
//
// Experiments are never deleted; stop() deactivates and records the reason.
class ExperimentStore {
public:
    explicit ExperimentStore(sqlite3* db);

    // Checks key, variant names, percentages (sum to 100) and window ordering.
    static bool validate(const ExperimentDefinition& definition, QString* errorOut = nullptr);

    bool create(const ExperimentDefinition& definition, QString* errorOut = nullptr);

    // Rewrites every mutable column and the ordered variant table.
    bool update(const ExperimentDefinition& definition, QString* errorOut = nullptr);

    std::optional<ExperimentDefinition> get(const QString& key);
    QVector<ExperimentDefinition> listAll();
    QVector<ExperimentDefinition> listActive();
    QVector<ExperimentDefinition> listAutoStopEnabled();

    bool activate(const QString& key);
    bool stop(const QString& key, const QString& reason);

    // Insert-once audit of a computed assignment. An existing row is kept.
    bool recordAssignment(const ExperimentAssignment& assignment);
    std::optional<ExperimentAssignment> findRecordedAssignment(const QString& subjectId,
                                                               const QString& experimentKey);

    // ── Alerts ──────────────────────────────────────────────

    std::optional<int64_t> insertAlert(const ExperimentAlert& alert);
    QVector<ExperimentAlert> listAlerts(bool unresolvedOnly);
    bool resolveAlert(int64_t alertId);

private:
    QVector<ExperimentDefinition> query(const char* whereClause);
    bool loadVariants(ExperimentDefinition& definition);
    bool writeVariants(const ExperimentDefinition& definition);
    bool setActive(const QString& key, bool active, const QString* reason);

    sqlite3* m_db = nullptr;
};

} // namespace nr
