#pragma once

#include "core/bandit/arm_selector.h"

#include <QRandomGenerator>

#include <mutex>
#include <optional>

namespace nr {

// Thompson sampling with a Beta posterior per enabled arm. Rewards are read
// as success mass: an arm samples Beta(sum + alpha, count - sum + beta), both
// observed terms floored at zero, and the highest draw wins. decisionValue
// is that draw. The pick counts as exploitation when it is also the arm with
// the highest posterior mean.
class ThompsonSamplingSelector : public ArmSelector {
public:
    explicit ThompsonSamplingSelector(double alpha = 1.0, double beta = 1.0,
                                      std::optional<quint32> seed = std::nullopt);

    std::optional<ArmSelection> selectArm(const BanditContext& context,
                                          const QVector<BanditArm>& arms) override;
    QString name() const override { return QStringLiteral("thompson"); }

    double alpha() const { return m_alpha; }
    double beta() const { return m_beta; }

private:
    double sampleBeta(double a, double b);

    double m_alpha = 1.0;
    double m_beta = 1.0;
    std::mutex m_mutex;
    QRandomGenerator m_random;
};

} // namespace nr
