#include "core/experiment/experiment_bucketing.h"
#include "core/shared/logging.h"

#include <QByteArray>
#include <QCryptographicHash>

namespace nr {
namespace bucketing {

int computeBucket(const QString& subjectId, const QString& experimentKey)
{
    const QByteArray input = (subjectId + QLatin1Char(':') + experimentKey).toUtf8();
    const QByteArray digest = QCryptographicHash::hash(input, QCryptographicHash::Sha256);

    const auto* bytes = reinterpret_cast<const unsigned char*>(digest.constData());
    const quint32 value = (static_cast<quint32>(bytes[0]) << 24)
                        | (static_cast<quint32>(bytes[1]) << 16)
                        | (static_cast<quint32>(bytes[2]) << 8)
                        | static_cast<quint32>(bytes[3]);
    return static_cast<int>(value % kBucketCount);
}

QString variantForBucket(const QVector<VariantAllocation>& allocation, int bucket, bool* covered)
{
    if (covered) {
        *covered = true;
    }
    if (allocation.isEmpty()) {
        if (covered) {
            *covered = false;
        }
        return QStringLiteral("control");
    }

    int upperBound = 0;
    for (const VariantAllocation& variant : allocation) {
        upperBound += variant.percentage;
        if (bucket < upperBound) {
            return variant.name;
        }
    }

    if (covered) {
        *covered = false;
    }
    return allocation.constLast().name;
}

ExperimentAssignment assign(const std::optional<ExperimentDefinition>& definition,
                            const QString& subjectId, const QString& experimentKey,
                            const QDateTime& now)
{
    ExperimentAssignment assignment;
    assignment.subjectId = subjectId;
    assignment.experimentKey = experimentKey;

    if (!definition.has_value() || !definition->isRunningAt(now)) {
        return assignment;
    }

    if (definition->totalPercentage() != 100) {
        LOG_WARN(nrExperiment, "Experiment %s allocates %d%% of traffic, uncovered buckets go to '%s'",
                 qUtf8Printable(experimentKey), definition->totalPercentage(),
                 qUtf8Printable(definition->orderedVariants.isEmpty()
                                    ? QStringLiteral("control")
                                    : definition->orderedVariants.constLast().name));
    }

    assignment.bucket = computeBucket(subjectId, experimentKey);
    assignment.variant = variantForBucket(definition->orderedVariants, assignment.bucket);
    assignment.isActive = true;
    return assignment;
}

} // namespace bucketing
} // namespace nr
