#include "core/bandit/ucb1_selector.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace nr {

Ucb1Selector::Ucb1Selector(std::optional<quint32> seed)
    : m_random(seed.has_value() ? QRandomGenerator(*seed)
                                : QRandomGenerator(QRandomGenerator::global()->generate()))
{
}

double Ucb1Selector::upperBound(const BanditArm& arm, int64_t totalPulls)
{
    if (arm.rewardCount <= 0) {
        return std::numeric_limits<double>::infinity();
    }
    const double width = std::sqrt(2.0 * std::log(static_cast<double>(totalPulls))
                                   / static_cast<double>(arm.rewardCount));
    return arm.meanReward() + width;
}

std::optional<ArmSelection> Ucb1Selector::selectArm(const BanditContext& context,
                                                    const QVector<BanditArm>& arms)
{
    Q_UNUSED(context);

    QVector<int> enabled;
    int64_t totalPulls = 0;
    for (int i = 0; i < arms.size(); ++i) {
        if (arms.at(i).enabled) {
            enabled.append(i);
            totalPulls += arms.at(i).rewardCount;
        }
    }
    if (enabled.isEmpty()) {
        return std::nullopt;
    }

    ArmSelection selection;
    if (totalPulls == 0) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const BanditArm& arm = arms.at(enabled.at(m_random.bounded(static_cast<int>(enabled.size()))));
        selection.armId = arm.armId;
        selection.decisionValue = std::numeric_limits<double>::infinity();
        selection.reason = SelectionReason::Exploration;
        return selection;
    }

    int best = -1;
    double bestBound = 0.0;
    std::optional<double> bestMean;
    for (int index : enabled) {
        const BanditArm& arm = arms.at(index);
        const double bound = upperBound(arm, totalPulls);
        if (best < 0 || bound > bestBound
            || (bound == bestBound && arm.armId < arms.at(best).armId)) {
            best = index;
            bestBound = bound;
        }
        if (arm.rewardCount > 0) {
            bestMean = bestMean ? std::max(*bestMean, arm.meanReward()) : arm.meanReward();
        }
    }

    const BanditArm& chosen = arms.at(best);
    selection.armId = chosen.armId;
    selection.decisionValue = bestBound;
    // Picking anything but the top observed mean is the confidence term at work.
    selection.reason = chosen.rewardCount > 0 && chosen.meanReward() >= *bestMean
        ? SelectionReason::Exploitation
        : SelectionReason::Exploration;
    return selection;
}

} // namespace nr
