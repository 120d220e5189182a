#pragma once

#include "core/bandit/arm_selector.h"

#include <QRandomGenerator>

#include <mutex>
#include <optional>

namespace nr {

// UCB1 over the enabled arms. An arm's bound is mean + sqrt(2 ln N / n),
// where N is the total pull count and n the arm's own; an untried arm's
// bound is infinite. The highest bound wins, lowest id on ties. Before any
// arm has been rewarded the pick is uniformly random.
class Ucb1Selector : public ArmSelector {
public:
    explicit Ucb1Selector(std::optional<quint32> seed = std::nullopt);

    std::optional<ArmSelection> selectArm(const BanditContext& context,
                                          const QVector<BanditArm>& arms) override;
    QString name() const override { return QStringLiteral("ucb1"); }

    static double upperBound(const BanditArm& arm, int64_t totalPulls);

private:
    std::mutex m_mutex;
    QRandomGenerator m_random;
};

} // namespace nr
