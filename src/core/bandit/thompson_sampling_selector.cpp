#include "core/bandit/thompson_sampling_selector.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <random>

namespace nr {

namespace {

constexpr double kMinPrior = 1e-6;

} // namespace

ThompsonSamplingSelector::ThompsonSamplingSelector(double alpha, double beta,
                                                   std::optional<quint32> seed)
    : m_alpha(std::max(alpha, kMinPrior))
    , m_beta(std::max(beta, kMinPrior))
    , m_random(seed.has_value() ? QRandomGenerator(*seed)
                                : QRandomGenerator(QRandomGenerator::global()->generate()))
{
}

// Beta(a, b) as X / (X + Y) with X ~ Gamma(a, 1) and Y ~ Gamma(b, 1).
double ThompsonSamplingSelector::sampleBeta(double a, double b)
{
    std::gamma_distribution<double> left(a, 1.0);
    std::gamma_distribution<double> right(b, 1.0);
    const double x = left(m_random);
    const double y = right(m_random);
    if (x + y <= 0.0) {
        return a / (a + b);
    }
    return x / (x + y);
}

std::optional<ArmSelection> ThompsonSamplingSelector::selectArm(const BanditContext& context,
                                                                const QVector<BanditArm>& arms)
{
    Q_UNUSED(context);

    std::lock_guard<std::mutex> lock(m_mutex);

    int chosen = -1;
    double chosenDraw = 0.0;
    int meanLeader = -1;
    double leaderMean = 0.0;
    for (int i = 0; i < arms.size(); ++i) {
        const BanditArm& arm = arms.at(i);
        if (!arm.enabled) {
            continue;
        }
        const double successes = std::max(0.0, arm.rewardSum) + m_alpha;
        const double failures =
            std::max(0.0, static_cast<double>(arm.rewardCount) - arm.rewardSum) + m_beta;

        const double draw = sampleBeta(successes, failures);
        if (chosen < 0 || draw > chosenDraw) {
            chosen = i;
            chosenDraw = draw;
        }
        const double posteriorMean = successes / (successes + failures);
        if (meanLeader < 0 || posteriorMean > leaderMean) {
            meanLeader = i;
            leaderMean = posteriorMean;
        }
    }
    if (chosen < 0) {
        return std::nullopt;
    }

    ArmSelection selection;
    selection.armId = arms.at(chosen).armId;
    selection.decisionValue = chosenDraw;
    selection.reason = chosen == meanLeader ? SelectionReason::Exploitation
                                            : SelectionReason::Exploration;
    LOG_DEBUG(nrBandit, "Thompson draw %.4f for arm %d", chosenDraw, selection.armId);
    return selection;
}

} // namespace nr
