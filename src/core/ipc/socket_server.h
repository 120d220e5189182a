#pragma once

#include "core/ipc/message.h"

#include <QList>
#include <QLocalServer>
#include <QLocalSocket>
#include <QMap>
#include <QObject>

#include <functional>
#include <memory>

namespace nr {

// Local-socket server that dispatches every decoded request to one handler
// and writes back whatever object the handler returns.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    static constexpr int kMaxReadBufferSize = 64 * 1024 * 1024;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    // Removes a stale socket file left by a dead process; refuses to steal a
    // socket that still has a live server behind it.
    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;

    void setRequestHandler(RequestHandler handler);

    void broadcast(const QJsonObject& notification);

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onClientReadyRead();
    void onClientDisconnected();

private:
    bool detachClient(QLocalSocket* client);
    void processBuffer(QLocalSocket* client);

    std::unique_ptr<QLocalServer> m_server;
    QList<QLocalSocket*> m_clients;
    QMap<QLocalSocket*, QByteArray> m_readBuffers;
    RequestHandler m_handler;
    bool m_closing = false;
};

} // namespace nr
