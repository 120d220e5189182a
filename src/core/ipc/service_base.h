#pragma once

#include "core/ipc/socket_server.h"

#include <QJsonObject>
#include <QString>

#include <memory>

namespace nr {

// ServiceBase -- a named process that answers requests on
// <socketDirectory>/<name>.sock. Subclasses override handleRequest() and
// fall back to this class for ping, shutdown and unknown methods.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listens on socketPath (or the default path when empty) and enters the
    // event loop. Returns the process exit code.
    int run(const QString& socketPathOverride = {});

    // Listens without entering the event loop; for tests and embedding.
    bool start(const QString& socketPathOverride = {});
    void stop();

    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();

    // Dispatches one request object; public so tests can bypass the socket.
    virtual QJsonObject handleRequest(const QJsonObject& request);

protected:
    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    void sendNotification(const QString& method, const QJsonObject& params = {});

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace nr
