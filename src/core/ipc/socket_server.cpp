#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

#include <utility>

namespace nr {

namespace {

bool socketHasLiveServer(const QString& socketPath)
{
    QLocalSocket probe;
    probe.connectToServer(socketPath);
    if (!probe.waitForConnected(150)) {
        return false;
    }
    probe.disconnectFromServer();
    return true;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>(this))
{
    connect(m_server.get(), &QLocalServer::newConnection, this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);

    if (m_server->listen(socketPath)) {
        qCInfo(nrIpc, "Listening on %s", qPrintable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        qCCritical(nrIpc, "Failed to listen on %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (socketHasLiveServer(socketPath)) {
        const QString err = QStringLiteral("Socket already served by another process: %1")
                                .arg(socketPath);
        qCCritical(nrIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    qCWarning(nrIpc, "Removing stale socket %s", qPrintable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        qCCritical(nrIpc, "Failed to listen on %s after cleanup: %s",
                   qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    qCInfo(nrIpc, "Listening on %s", qPrintable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    const QList<QLocalSocket*> clients = m_clients;
    m_clients.clear();
    m_readBuffers.clear();

    for (QLocalSocket* client : clients) {
        client->disconnect(this);
        if (client->state() != QLocalSocket::UnconnectedState) {
            client->disconnectFromServer();
        }
        client->deleteLater();
    }

    if (m_server->isListening()) {
        const QString path = m_server->fullServerName();
        m_server->close();
        qCInfo(nrIpc, "Server closed: %s", qPrintable(path));
    }

    m_closing = false;
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::broadcast(const QJsonObject& notification)
{
    const QByteArray encoded = IpcMessage::encode(notification);
    if (encoded.isEmpty()) {
        return;
    }
    for (QLocalSocket* client : std::as_const(m_clients)) {
        client->write(encoded);
        client->flush();
    }
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_clients.append(client);
        m_readBuffers.insert(client, QByteArray());

        connect(client, &QLocalSocket::readyRead, this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected, this, &SocketServer::onClientDisconnected);

        qCDebug(nrIpc, "Client connected (%d total)", static_cast<int>(m_clients.size()));
        emit clientConnected();
    }
}

void SocketServer::onClientReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (!client || !m_readBuffers.contains(client)) {
        return;
    }

    QByteArray& buffer = m_readBuffers[client];
    buffer.append(client->readAll());

    if (buffer.size() > kMaxReadBufferSize) {
        qCCritical(nrIpc, "Client read buffer exceeded %d bytes, dropping client",
                   kMaxReadBufferSize);
        const bool tracked = detachClient(client);
        client->disconnectFromServer();
        if (tracked) {
            client->deleteLater();
            emit clientDisconnected();
        }
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && detachClient(client)) {
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    const bool removedClient = m_clients.removeOne(client);
    const bool removedBuffer = m_readBuffers.remove(client) > 0;
    return removedClient || removedBuffer;
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    while (m_readBuffers.contains(client)) {
        QByteArray& buffer = m_readBuffers[client];
        auto frame = IpcMessage::decode(buffer);
        if (!frame) {
            break;
        }
        buffer.remove(0, frame->bytesConsumed);

        const QJsonObject& incoming = frame->json;
        const QString type = incoming.value(QStringLiteral("type")).toString();

        if (type == QLatin1String("notification")) {
            if (m_handler) {
                m_handler(incoming);
            }
            continue;
        }
        if (type != QLatin1String("request")) {
            qCWarning(nrIpc, "Unexpected frame type '%s'", qPrintable(type));
            continue;
        }

        qCDebug(nrIpc, "Request %s id=%llu", qPrintable(IpcMessage::method(incoming)),
                static_cast<unsigned long long>(IpcMessage::requestId(incoming)));

        const QJsonObject response = m_handler
            ? m_handler(incoming)
            : IpcMessage::makeError(IpcMessage::requestId(incoming), IpcErrorCode::InternalError,
                                    QStringLiteral("No request handler registered"));

        const QByteArray encoded = IpcMessage::encode(response);
        if (!encoded.isEmpty() && m_readBuffers.contains(client)) {
            client->write(encoded);
            client->flush();
        }
    }
}

} // namespace nr
