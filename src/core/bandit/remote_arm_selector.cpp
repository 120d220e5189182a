#include "core/bandit/remote_arm_selector.h"
#include "core/ipc/socket_client.h"
#include "core/shared/circuit_breaker.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonObject>

#include <algorithm>

namespace nr {

RemoteArmSelector::RemoteArmSelector(QString socketPath, int timeoutMs, CircuitBreaker& breaker)
    : m_socketPath(std::move(socketPath))
    , m_timeoutMs(std::max(1, timeoutMs))
    , m_breaker(breaker)
    , m_client(std::make_unique<SocketClient>())
{
}

RemoteArmSelector::~RemoteArmSelector() = default;

std::optional<ArmSelection> RemoteArmSelector::selectArm(const BanditContext& context,
                                                         const QVector<BanditArm>& arms)
{
    if (m_breaker.isOpen()) {
        LOG_DEBUG(nrBandit, "Remote selector breaker open, skipping call");
        return std::nullopt;
    }

    std::optional<ArmSelection> selection = request(context, arms);
    if (selection.has_value()) {
        m_breaker.recordSuccess();
    } else {
        m_breaker.recordFailure();
    }
    return selection;
}

std::optional<ArmSelection> RemoteArmSelector::request(const BanditContext& context,
                                                       const QVector<BanditArm>& arms)
{
    if (!m_client->isConnected() && !m_client->connectToServer(m_socketPath, m_timeoutMs)) {
        LOG_WARN(nrBandit, "Remote selector unreachable at %s", qUtf8Printable(m_socketPath));
        return std::nullopt;
    }

    QJsonArray armsJson;
    for (const BanditArm& arm : arms) {
        if (!arm.enabled) {
            continue;
        }
        armsJson.append(QJsonObject{
            {QStringLiteral("armId"), arm.armId},
            {QStringLiteral("name"), arm.name},
            {QStringLiteral("rewardCount"), static_cast<qint64>(arm.rewardCount)},
            {QStringLiteral("meanReward"), arm.meanReward()},
        });
    }

    const QJsonObject params{
        {QStringLiteral("context"), QJsonObject{
            {QStringLiteral("subjectId"), context.subjectId},
            {QStringLiteral("timeSlot"), context.timeSlot},
            {QStringLiteral("category"), context.category},
            {QStringLiteral("experimentKey"), context.experimentKey},
        }},
        {QStringLiteral("arms"), armsJson},
    };

    const std::optional<QJsonObject> response =
        m_client->sendRequest(QStringLiteral("selectArm"), params, m_timeoutMs);
    if (!response.has_value()) {
        LOG_WARN(nrBandit, "Remote selector timed out after %dms", m_timeoutMs);
        m_client->disconnect();
        return std::nullopt;
    }
    if (IpcMessage::isError(*response)) {
        LOG_WARN(nrBandit, "Remote selector error: %s",
                 qUtf8Printable(IpcMessage::errorMessage(*response)));
        return std::nullopt;
    }

    const QJsonObject result = response->value(QStringLiteral("result")).toObject();
    const int armId = result.value(QStringLiteral("armId")).toInt(-1);
    const bool known = std::any_of(arms.begin(), arms.end(), [armId](const BanditArm& arm) {
        return arm.enabled && arm.armId == armId;
    });
    if (!known) {
        LOG_WARN(nrBandit, "Remote selector returned unknown arm %d", armId);
        return std::nullopt;
    }

    ArmSelection selection;
    selection.armId = armId;
    selection.decisionValue = result.value(QStringLiteral("decisionValue")).toDouble();
    const QString reason = result.value(QStringLiteral("reason")).toString();
    selection.reason = reason.isEmpty() ? SelectionReason::Exploitation
                                        : selectionReasonFromString(reason);
    return selection;
}

} // namespace nr
