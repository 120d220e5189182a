#pragma once

#include "core/ipc/message.h"

#include <QLocalSocket>
#include <QMap>
#include <QObject>

#include <memory>
#include <optional>

namespace nr {

// Blocking request/response client for a SocketServer.
//
// sendRequest() waits on the socket itself instead of spinning the event
// loop, so it is safe to call from inside a request handler.
class SocketClient : public QObject {
    Q_OBJECT
public:
    explicit SocketClient(QObject* parent = nullptr);
    ~SocketClient() override;

    static constexpr int kMaxReadBufferSize = 64 * 1024 * 1024;

    bool connectToServer(const QString& socketPath, int timeoutMs = 5000);
    void disconnect();
    bool isConnected() const;

    // Returns the response or error object; nullopt on timeout or transport failure.
    std::optional<QJsonObject> sendRequest(const QString& method,
                                           const QJsonObject& params = {},
                                           int timeoutMs = 30000);

signals:
    void disconnected();
    void errorOccurred(const QString& error);

private slots:
    void onReadyRead();
    void onDisconnected();

private:
    struct PendingRequest {
        QJsonObject response;
        bool completed = false;
    };

    std::unique_ptr<QLocalSocket> m_socket;
    QByteArray m_readBuffer;
    uint64_t m_nextRequestId = 1;
    QMap<uint64_t, std::shared_ptr<PendingRequest>> m_pending;
};

} // namespace nr
