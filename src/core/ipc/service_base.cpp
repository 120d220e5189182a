#include "core/ipc/service_base.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <sys/types.h>
#include <unistd.h>

#include <cstdio>

namespace nr {

namespace {

QString envPath(const char* name)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>(this))
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase() = default;

bool ServiceBase::start(const QString& socketPathOverride)
{
    const QString path = socketPathOverride.isEmpty() ? socketPath(m_serviceName)
                                                      : socketPathOverride;

    const QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCCritical(nrIpc, "Failed to create socket directory: %s", qPrintable(dir.path()));
        return false;
    }

    if (!m_server->listen(path)) {
        qCCritical(nrIpc, "Service '%s' failed to start", qPrintable(m_serviceName));
        return false;
    }
    qCInfo(nrIpc, "Service '%s' started on %s", qPrintable(m_serviceName), qPrintable(path));
    return true;
}

void ServiceBase::stop()
{
    m_server->close();
}

int ServiceBase::run(const QString& socketPathOverride)
{
    if (!start(socketPathOverride)) {
        return 1;
    }

    // Readiness line for process supervisors.
    fprintf(stdout, "ready\n");
    fflush(stdout);

    return QCoreApplication::exec();
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    const QString explicitPath = envPath("NEWSRANK_SOCKET_PATH");
    if (!explicitPath.isEmpty()) {
        return explicitPath;
    }
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/') + serviceName
                           + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString runtimeDir = envPath("NEWSRANK_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir;
    }
    return QStringLiteral("/tmp/newsrank-%1").arg(getuid());
}

QString ServiceBase::socketDirectory()
{
    return runtimeDirectory();
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString method = IpcMessage::method(request);
    if (method == QLatin1String("ping")) {
        return handlePing(request);
    }
    if (method == QLatin1String("shutdown")) {
        return handleShutdown(request);
    }

    qCWarning(nrIpc, "Unknown method '%s' in service '%s'",
              qPrintable(method), qPrintable(m_serviceName));
    return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(method));
}

QJsonObject ServiceBase::handlePing(const QJsonObject& request)
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    result[QStringLiteral("service")] = m_serviceName;
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

QJsonObject ServiceBase::handleShutdown(const QJsonObject& request)
{
    qCInfo(nrIpc, "Shutdown requested for service '%s'", qPrintable(m_serviceName));

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;

    if (QCoreApplication::instance()) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    }
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

void ServiceBase::sendNotification(const QString& method, const QJsonObject& params)
{
    m_server->broadcast(IpcMessage::makeNotification(method, params));
}

} // namespace nr
