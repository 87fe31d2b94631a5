#pragma once

#include "core/ipc/socket_server.h"

#include <QJsonObject>
#include <QObject>
#include <QString>

#include <memory>

namespace pa {

class ServiceBase : public QObject {
    Q_OBJECT
public:
    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    // Listens on socketPath(serviceName) and enters the event loop.
    int run();

    // Listens without entering the event loop.
    bool start(const QString& socketPath);

    const QString& serviceName() const { return m_serviceName; }

    // PHONEADVISOR_RUNTIME_DIR, else /tmp/phoneadvisor-<uid>
    static QString runtimeDirectory();
    // PHONEADVISOR_SOCKET_DIR, else runtimeDirectory()
    static QString socketDirectory();
    static QString socketPath(const QString& serviceName);

protected:
    virtual QJsonObject handleRequest(const QJsonObject& request);

    QJsonObject handlePing(const QJsonObject& request);
    QJsonObject handleShutdown(const QJsonObject& request);

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
};

} // namespace pa
