#pragma once

#include "core/experiment/assignment_cache.h"
#include "core/shared/types.h"

#include <QDateTime>
#include <QString>
#include <QVector>

#include <optional>

namespace nr {

class ExperimentStore;
class FeatureFlags;

// ExperimentService -- assignment lookups and experiment administration.
//
// getAssignment() never fails: store errors, unknown keys and disabled
// experimentation all resolve to the inactive "control" assignment. Every
// administrative write invalidates the cached assignments of the experiment
// it touched.
class ExperimentService {
public:
    ExperimentService(ExperimentStore& store, AssignmentCacheConfig cacheConfig = {},
                      FeatureFlags* flags = nullptr);

    ExperimentAssignment getAssignment(const QString& subjectId, const QString& experimentKey,
                                       const QDateTime& now = QDateTime::currentDateTimeUtc());

    // When enabled, active assignments are written once to the audit table.
    void setRecordAssignments(bool enabled) { m_recordAssignments = enabled; }

    bool createExperiment(const ExperimentDefinition& definition, QString* errorOut = nullptr);
    bool updateExperiment(const ExperimentDefinition& definition, QString* errorOut = nullptr);
    bool activateExperiment(const QString& key, QString* errorOut = nullptr);
    bool stopExperiment(const QString& key, const QString& reason, QString* errorOut = nullptr);

    std::optional<ExperimentDefinition> experiment(const QString& key);
    QVector<ExperimentDefinition> listExperiments(bool activeOnly);

    AssignmentCache& cache() { return m_cache; }

private:
    ExperimentStore& m_store;
    AssignmentCache m_cache;
    FeatureFlags* m_flags = nullptr;
    bool m_recordAssignments = false;
};

} // namespace nr
