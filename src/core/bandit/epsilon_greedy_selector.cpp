#include "core/bandit/epsilon_greedy_selector.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace nr {

EpsilonGreedySelector::EpsilonGreedySelector(double epsilon, std::optional<quint32> seed)
    : m_epsilon(std::clamp(epsilon, 0.0, 1.0))
    , m_random(seed.has_value() ? QRandomGenerator(*seed)
                                : QRandomGenerator(QRandomGenerator::global()->generate()))
{
}

int EpsilonGreedySelector::bestArmIndex(const QVector<BanditArm>& arms)
{
    int best = -1;
    for (int i = 0; i < arms.size(); ++i) {
        const BanditArm& arm = arms.at(i);
        if (!arm.enabled) {
            continue;
        }
        if (best < 0) {
            best = i;
            continue;
        }
        const double mean = arm.meanReward();
        const double bestMean = arms.at(best).meanReward();
        if (mean > bestMean || (mean == bestMean && arm.armId < arms.at(best).armId)) {
            best = i;
        }
    }
    return best;
}

std::optional<ArmSelection> EpsilonGreedySelector::selectArm(const BanditContext& context,
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

    std::lock_guard<std::mutex> lock(m_mutex);

    ArmSelection selection;
    if (totalPulls == 0 || m_random.generateDouble() < m_epsilon) {
        const BanditArm& arm = arms.at(enabled.at(m_random.bounded(static_cast<int>(enabled.size()))));
        selection.armId = arm.armId;
        selection.decisionValue = arm.meanReward();
        selection.reason = SelectionReason::Exploration;
        return selection;
    }

    const BanditArm& arm = arms.at(bestArmIndex(arms));
    selection.armId = arm.armId;
    selection.decisionValue = arm.meanReward();
    selection.reason = SelectionReason::Exploitation;
    return selection;
}

} // namespace nr
