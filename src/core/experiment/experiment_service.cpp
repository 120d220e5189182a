#include "core/experiment/experiment_service.h"
#include "core/experiment/experiment_bucketing.h"
#include "core/experiment/feature_flags.h"
#include "core/shared/logging.h"
#include "core/store/experiment_store.h"

namespace nr {

namespace {

void setError(QString* errorOut, const QString& message)
{
    if (errorOut) {
        *errorOut = message;
    }
}

} // namespace

ExperimentService::ExperimentService(ExperimentStore& store, AssignmentCacheConfig cacheConfig,
                                     FeatureFlags* flags)
    : m_store(store)
    , m_cache(cacheConfig)
    , m_flags(flags)
{
}

ExperimentAssignment ExperimentService::getAssignment(const QString& subjectId,
                                                      const QString& experimentKey,
                                                      const QDateTime& now)
{
    if (m_flags && !m_flags->isEnabled(QString::fromLatin1(flags::kRankAb))) {
        return bucketing::assign(std::nullopt, subjectId, experimentKey, now);
    }

    if (auto cached = m_cache.get(subjectId, experimentKey, now)) {
        return *cached;
    }

    const std::optional<ExperimentDefinition> definition = m_store.get(experimentKey);
    const ExperimentAssignment assignment =
        bucketing::assign(definition, subjectId, experimentKey, now);

    if (assignment.isActive && m_recordAssignments && !m_store.recordAssignment(assignment)) {
        LOG_WARN(nrExperiment, "Failed to audit assignment %s/%s",
                 qUtf8Printable(experimentKey), qUtf8Printable(subjectId));
    }

    // The entry only holds while the schedule window keeps the same answer.
    QDateTime validFrom;
    QDateTime validUntil;
    if (definition && definition->isActive) {
        if (assignment.isActive) {
            validFrom = definition->startAt;
            validUntil = definition->endAt;
        } else if (definition->startAt.isValid() && now < definition->startAt) {
            validUntil = definition->startAt.addMSecs(-1);
        } else if (definition->endAt.isValid() && now > definition->endAt) {
            validFrom = definition->endAt.addMSecs(1);
        }
    }
    m_cache.put(assignment, validFrom, validUntil);
    return assignment;
}

bool ExperimentService::createExperiment(const ExperimentDefinition& definition, QString* errorOut)
{
    if (!m_store.create(definition, errorOut)) {
        return false;
    }
    m_cache.invalidateExperiment(definition.key);
    LOG_INFO(nrExperiment, "Created experiment %s with %d variants (active=%d)",
             qUtf8Printable(definition.key), static_cast<int>(definition.orderedVariants.size()),
             definition.isActive ? 1 : 0);
    return true;
}

bool ExperimentService::updateExperiment(const ExperimentDefinition& definition, QString* errorOut)
{
    if (!m_store.update(definition, errorOut)) {
        return false;
    }
    m_cache.invalidateExperiment(definition.key);
    return true;
}

bool ExperimentService::activateExperiment(const QString& key, QString* errorOut)
{
    if (!m_store.get(key).has_value()) {
        setError(errorOut, QStringLiteral("Experiment '%1' not found").arg(key));
        return false;
    }
    if (!m_store.activate(key)) {
        setError(errorOut, QStringLiteral("Failed to activate experiment '%1'").arg(key));
        return false;
    }
    m_cache.invalidateExperiment(key);
    LOG_INFO(nrExperiment, "Activated experiment %s", qUtf8Printable(key));
    return true;
}

bool ExperimentService::stopExperiment(const QString& key, const QString& reason, QString* errorOut)
{
    if (!m_store.get(key).has_value()) {
        setError(errorOut, QStringLiteral("Experiment '%1' not found").arg(key));
        return false;
    }
    if (!m_store.stop(key, reason)) {
        setError(errorOut, QStringLiteral("Failed to stop experiment '%1'").arg(key));
        return false;
    }
    m_cache.invalidateExperiment(key);
    LOG_INFO(nrExperiment, "Stopped experiment %s: %s", qUtf8Printable(key), qUtf8Printable(reason));
    return true;
}

std::optional<ExperimentDefinition> ExperimentService::experiment(const QString& key)
{
    return m_store.get(key);
}

QVector<ExperimentDefinition> ExperimentService::listExperiments(bool activeOnly)
{
    return activeOnly ? m_store.listActive() : m_store.listAll();
}

} // namespace nr
