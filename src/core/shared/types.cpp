#include "core/shared/types.h"

#include <algorithm>

namespace nr {

QString selectionReasonToString(SelectionReason reason)
{
    switch (reason) {
    case SelectionReason::Exploration:  return QStringLiteral("EXPLORATION");
    case SelectionReason::Exploitation: return QStringLiteral("EXPLOITATION");
    case SelectionReason::Fallback:     return QStringLiteral("FALLBACK");
    }
    return QStringLiteral("FALLBACK");
}

SelectionReason selectionReasonFromString(const QString& str)
{
    if (str == QLatin1String("EXPLORATION"))  return SelectionReason::Exploration;
    if (str == QLatin1String("EXPLOITATION")) return SelectionReason::Exploitation;
    return SelectionReason::Fallback;
}

QString rewardTypeToString(RewardType type)
{
    switch (type) {
    case RewardType::Click:      return QStringLiteral("CLICK");
    case RewardType::DwellTime:  return QStringLiteral("DWELL_TIME");
    case RewardType::Engagement: return QStringLiteral("ENGAGEMENT");
    }
    return QStringLiteral("CLICK");
}

std::optional<RewardType> rewardTypeFromString(const QString& str)
{
    const QString upper = str.trimmed().toUpper();
    if (upper == QLatin1String("CLICK"))      return RewardType::Click;
    if (upper == QLatin1String("DWELL_TIME")) return RewardType::DwellTime;
    if (upper == QLatin1String("ENGAGEMENT")) return RewardType::Engagement;
    return std::nullopt;
}

QString datePartitionFor(const QDateTime& timestamp)
{
    return timestamp.toUTC().date().toString(Qt::ISODate);
}

int ExperimentDefinition::totalPercentage() const
{
    int total = 0;
    for (const VariantAllocation& allocation : orderedVariants) {
        total += allocation.percentage;
    }
    return total;
}

bool ExperimentDefinition::isRunningAt(const QDateTime& now) const
{
    if (!isActive) {
        return false;
    }
    if (startAt.isValid() && now < startAt) {
        return false;
    }
    if (endAt.isValid() && now > endAt) {
        return false;
    }
    return true;
}

double BanditArm::meanReward() const
{
    return rewardCount > 0 ? rewardSum / static_cast<double>(rewardCount) : 0.0;
}

double BanditArm::rewardVariance() const
{
    if (rewardCount < 2) {
        return 0.0;
    }
    const double n = static_cast<double>(rewardCount);
    const double mean = rewardSum / n;
    return std::max(0.0, rewardSumSquared / n - mean * mean);
}

} // namespace nr
