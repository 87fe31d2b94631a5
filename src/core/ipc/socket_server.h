#pragma once

#include "core/ipc/message.h"

#include <QByteArray>
#include <QHash>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>
#include <QSet>

#include <functional>
#include <memory>

namespace pa {

// Local-socket server that decodes request frames, hands each to a
// handler, and writes the handler's reply back on the same connection.
class SocketServer : public QObject {
    Q_OBJECT
public:
    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    static constexpr int kMaxReadBufferSize = IpcMessage::kMaxMessageSize + IpcMessage::kHeaderSize;

    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;
    int clientCount() const { return static_cast<int>(m_readBuffers.size()); }

    void setRequestHandler(RequestHandler handler);

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
    void dropClient(QLocalSocket* client);
    void processBuffer(QLocalSocket* client);
    QJsonObject dispatch(const QJsonObject& request) const;

    std::unique_ptr<QLocalServer> m_server;
    QHash<QLocalSocket*, QByteArray> m_readBuffers;
    QSet<QLocalSocket*> m_dispatching;
    RequestHandler m_handler;
    bool m_closing = false;
};

} // namespace pa
