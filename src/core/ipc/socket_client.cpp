#include "core/ipc/socket_client.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>

namespace nr {

namespace {

bool isTransientConnectError(QLocalSocket::LocalSocketError error)
{
    return error == QLocalSocket::ServerNotFoundError
        || error == QLocalSocket::ConnectionRefusedError
        || error == QLocalSocket::SocketTimeoutError;
}

} // namespace

SocketClient::SocketClient(QObject* parent)
    : QObject(parent)
    , m_socket(std::make_unique<QLocalSocket>(this))
{
    connect(m_socket.get(), &QLocalSocket::readyRead, this, &SocketClient::onReadyRead);
    connect(m_socket.get(), &QLocalSocket::disconnected, this, &SocketClient::onDisconnected);
}

SocketClient::~SocketClient()
{
    disconnect();
}

bool SocketClient::connectToServer(const QString& socketPath, int timeoutMs)
{
    const QString path = socketPath.trimmed();
    if (path.isEmpty() || timeoutMs <= 0) {
        const QString err = QStringLiteral("Invalid connect arguments (path='%1', timeout=%2ms)")
                                .arg(path)
                                .arg(timeoutMs);
        qCCritical(nrIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (m_socket->state() == QLocalSocket::ConnectedState && m_socket->serverName() == path) {
        return true;
    }

    m_socket->abort();
    m_readBuffer.clear();
    m_pending.clear();

    m_socket->connectToServer(path);
    if (!m_socket->waitForConnected(timeoutMs)) {
        const auto error = m_socket->error();
        if (isTransientConnectError(error)) {
            qCDebug(nrIpc, "No server at %s: %s", qPrintable(path),
                    qPrintable(m_socket->errorString()));
        } else {
            qCCritical(nrIpc, "Connect to %s failed: %s (error=%d)", qPrintable(path),
                       qPrintable(m_socket->errorString()), static_cast<int>(error));
            emit errorOccurred(m_socket->errorString());
        }
        return false;
    }

    qCDebug(nrIpc, "Connected to %s", qPrintable(path));
    return true;
}

void SocketClient::disconnect()
{
    if (m_socket->state() != QLocalSocket::UnconnectedState) {
        m_socket->disconnectFromServer();
    }
    m_readBuffer.clear();
    m_pending.clear();
}

bool SocketClient::isConnected() const
{
    return m_socket->state() == QLocalSocket::ConnectedState;
}

std::optional<QJsonObject> SocketClient::sendRequest(const QString& method,
                                                     const QJsonObject& params,
                                                     int timeoutMs)
{
    if (!isConnected()) {
        qCWarning(nrIpc, "Cannot send %s: not connected", qPrintable(method));
        return std::nullopt;
    }

    const uint64_t id = m_nextRequestId++;
    const QByteArray encoded = IpcMessage::encode(IpcMessage::makeRequest(id, method, params));
    if (encoded.isEmpty()) {
        return std::nullopt;
    }

    auto pending = std::make_shared<PendingRequest>();
    m_pending.insert(id, pending);

    m_socket->write(encoded);
    m_socket->flush();

    QElapsedTimer timer;
    timer.start();
    while (!pending->completed) {
        const int remainingMs = timeoutMs - static_cast<int>(timer.elapsed());
        if (remainingMs <= 0) {
            break;
        }
        if (m_socket->bytesAvailable() == 0) {
            m_socket->waitForReadyRead(std::min(remainingMs, 50));
        }
        if (m_socket->bytesAvailable() > 0 || m_socket->state() != QLocalSocket::ConnectedState) {
            onReadyRead();
        }
        if (m_socket->state() == QLocalSocket::UnconnectedState && !pending->completed) {
            break;
        }
    }

    m_pending.remove(id);

    if (!pending->completed) {
        qCWarning(nrIpc, "Request %s (id=%llu) timed out after %dms", qPrintable(method),
                  static_cast<unsigned long long>(id), timeoutMs);
        return std::nullopt;
    }
    return pending->response;
}

void SocketClient::onReadyRead()
{
    m_readBuffer.append(m_socket->readAll());

    if (m_readBuffer.size() > kMaxReadBufferSize) {
        qCCritical(nrIpc, "Read buffer exceeded %d bytes, disconnecting", kMaxReadBufferSize);
        m_readBuffer.clear();
        m_socket->disconnectFromServer();
        return;
    }

    while (auto frame = IpcMessage::decode(m_readBuffer)) {
        m_readBuffer.remove(0, frame->bytesConsumed);

        const QString type = frame->json.value(QStringLiteral("type")).toString();
        if (type != QLatin1String("response") && type != QLatin1String("error")) {
            qCDebug(nrIpc, "Ignoring %s frame", qPrintable(type));
            continue;
        }

        const uint64_t id = IpcMessage::requestId(frame->json);
        auto it = m_pending.find(id);
        if (it == m_pending.end()) {
            qCWarning(nrIpc, "Response for unknown request id=%llu",
                      static_cast<unsigned long long>(id));
            continue;
        }
        it.value()->response = frame->json;
        it.value()->completed = true;
    }
}

void SocketClient::onDisconnected()
{
    qCDebug(nrIpc, "Disconnected from server");

    for (auto it = m_pending.begin(); it != m_pending.end(); ++it) {
        it.value()->response = IpcMessage::makeError(it.key(), IpcErrorCode::ServiceUnavailable,
                                                     QStringLiteral("Connection lost"));
        it.value()->completed = true;
    }

    emit disconnected();
}

} // namespace nr
