#pragma once

#include "core/shared/types.h"

#include <QDateTime>
#include <QString>
#include <QVector>

#include <optional>

namespace nr {

// Deterministic subject -> variant mapping.
//
// bucket = first four bytes of SHA-256("<subjectId>:<experimentKey>") read as
// a big-endian unsigned integer, mod 100. Variants are walked in their stored
// order; the first whose cumulative percentage exceeds the bucket wins.
namespace bucketing {

constexpr int kBucketCount = 100;

int computeBucket(const QString& subjectId, const QString& experimentKey);

// covered is set to false when the allocation leaves the bucket unassigned
// and the last variant was used instead.
QString variantForBucket(const QVector<VariantAllocation>& allocation, int bucket,
                         bool* covered = nullptr);

// Absent, inactive or out-of-window experiments yield "control" with
// isActive=false and bucket -1.
ExperimentAssignment assign(const std::optional<ExperimentDefinition>& definition,
                            const QString& subjectId, const QString& experimentKey,
                            const QDateTime& now);

} // namespace bucketing
} // namespace nr
