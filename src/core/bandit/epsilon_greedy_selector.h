#pragma once

#include "core/bandit/arm_selector.h"

#include <QRandomGenerator>

#include <mutex>
#include <optional>

namespace nr {

// With probability epsilon (or while no arm has been rewarded) a uniformly
// random enabled arm; otherwise the enabled arm with the highest mean
// reward, lowest id on ties. decisionValue is the chosen arm's mean.
class EpsilonGreedySelector : public ArmSelector {
public:
    explicit EpsilonGreedySelector(double epsilon, std::optional<quint32> seed = std::nullopt);

    std::optional<ArmSelection> selectArm(const BanditContext& context,
                                          const QVector<BanditArm>& arms) override;
    QString name() const override { return QStringLiteral("epsilon-greedy"); }

    double epsilon() const { return m_epsilon; }

    static int bestArmIndex(const QVector<BanditArm>& arms);

private:
    double m_epsilon = 0.1;
    std::mutex m_mutex;
    QRandomGenerator m_random;
};

} // namespace nr
