#include "core/ipc/service_base.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <sys/types.h>
#include <unistd.h>

#include <cstdio>

namespace pa {

namespace {

QString envDirectory(const char* name)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>())
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return handleRequest(request);
    });
}

ServiceBase::~ServiceBase() = default;

bool ServiceBase::start(const QString& socketPath)
{
    const QDir dir = QFileInfo(socketPath).dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        LOG_ERROR(paIpc, "Cannot create socket directory %s", qPrintable(dir.path()));
        return false;
    }
    if (!m_server->listen(socketPath)) {
        LOG_ERROR(paIpc, "Service '%s' failed to start", qPrintable(m_serviceName));
        return false;
    }
    return true;
}

int ServiceBase::run()
{
    const QString path = socketPath(m_serviceName);
    if (!start(path)) {
        return 1;
    }

    LOG_INFO(paIpc, "Service '%s' ready on %s", qPrintable(m_serviceName), qPrintable(path));
    // Launchers wait for this line before connecting.
    std::fprintf(stdout, "ready\n");
    std::fflush(stdout);

    return QCoreApplication::exec();
}

QString ServiceBase::runtimeDirectory()
{
    const QString runtimeDir = envDirectory("PHONEADVISOR_RUNTIME_DIR");
    if (!runtimeDir.isEmpty()) {
        return runtimeDir;
    }
    return QStringLiteral("/tmp/phoneadvisor-%1").arg(getuid());
}

QString ServiceBase::socketDirectory()
{
    const QString socketDir = envDirectory("PHONEADVISOR_SOCKET_DIR");
    return socketDir.isEmpty() ? runtimeDirectory() : socketDir;
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir::cleanPath(socketDirectory() + QLatin1Char('/') + serviceName
                           + QStringLiteral(".sock"));
}

QJsonObject ServiceBase::handleRequest(const QJsonObject& request)
{
    const QString name = request.value(QStringLiteral("method")).toString();
    if (name == QLatin1String(method::kPing)) {
        return handlePing(request);
    }
    if (name == QLatin1String(method::kShutdown)) {
        return handleShutdown(request);
    }

    LOG_WARN(paIpc, "Unknown method '%s' for service '%s'",
             qPrintable(name), qPrintable(m_serviceName));
    return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::NotFound,
                                 QStringLiteral("Unknown method: %1").arg(name));
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
    LOG_INFO(paIpc, "Shutdown requested for '%s'", qPrintable(m_serviceName));

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;

    // Queued so the reply is written before the loop exits.
    if (QCoreApplication::instance()) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                                  Qt::QueuedConnection);
    }
    return IpcMessage::makeResponse(IpcMessage::requestId(request), result);
}

} // namespace pa
