#pragma once

#include "core/bandit/arm_selector.h"

#include <QString>

#include <memory>

namespace nr {

struct CircuitBreaker;
class SocketClient;

// Delegates arm choice to an external decision service speaking the engine's
// socket protocol:
//   request  selectArm {context, arms:[{armId, name, rewardCount, meanReward}]}
//   response {armId, decisionValue, reason}
// Every call is bounded by timeoutMs and guarded by the breaker; any failure
// yields nullopt.
class RemoteArmSelector : public ArmSelector {
public:
    RemoteArmSelector(QString socketPath, int timeoutMs, CircuitBreaker& breaker);
    ~RemoteArmSelector() override;

    std::optional<ArmSelection> selectArm(const BanditContext& context,
                                          const QVector<BanditArm>& arms) override;
    QString name() const override { return QStringLiteral("remote"); }

private:
    std::optional<ArmSelection> request(const BanditContext& context,
                                        const QVector<BanditArm>& arms);

    QString m_socketPath;
    int m_timeoutMs = 200;
    CircuitBreaker& m_breaker;
    std::unique_ptr<SocketClient> m_client;
};

} // namespace nr
