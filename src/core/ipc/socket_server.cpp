#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

#include <QPointer>

namespace pa {

namespace {

// A leftover socket file from a crashed run accepts no connections.
bool isSocketServed(const QString& socketPath)
{
    QLocalSocket peer;
    peer.connectToServer(socketPath);
    if (!peer.waitForConnected(150)) {
        return false;
    }
    peer.disconnectFromServer();
    return true;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>())
{
    connect(m_server.get(), &QLocalServer::newConnection,
            this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (m_server->listen(socketPath)) {
        LOG_INFO(paIpc, "Listening on %s", qPrintable(socketPath));
        return true;
    }

    if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
        const QString err = m_server->errorString();
        LOG_ERROR(paIpc, "Failed to listen on %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    if (isSocketServed(socketPath)) {
        const QString err = QStringLiteral("Another advisor is already serving %1").arg(socketPath);
        LOG_ERROR(paIpc, "%s", qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_WARN(paIpc, "Removing stale socket %s", qPrintable(socketPath));
    QLocalServer::removeServer(socketPath);
    if (!m_server->listen(socketPath)) {
        const QString err = m_server->errorString();
        LOG_ERROR(paIpc, "Failed to listen on %s: %s", qPrintable(socketPath), qPrintable(err));
        emit errorOccurred(err);
        return false;
    }

    LOG_INFO(paIpc, "Listening on %s", qPrintable(socketPath));
    return true;
}

void SocketServer::close()
{
    if (m_closing) {
        return;
    }
    m_closing = true;

    // Forget clients before disconnecting so their disconnected() signals are no-ops.
    const QList<QLocalSocket*> clients = m_readBuffers.keys();
    m_readBuffers.clear();
    m_dispatching.clear();
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
        LOG_INFO(paIpc, "Closed %s", qPrintable(path));
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

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        m_readBuffers.insert(client, QByteArray());
        connect(client, &QLocalSocket::readyRead, this, &SocketServer::onClientReadyRead);
        connect(client, &QLocalSocket::disconnected, this, &SocketServer::onClientDisconnected);
        LOG_DEBUG(paIpc, "Client connected (%d total)", clientCount());
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
        LOG_ERROR(paIpc, "Client sent more than %d unframed bytes, dropping it", kMaxReadBufferSize);
        dropClient(client);
        return;
    }

    processBuffer(client);
}

void SocketServer::onClientDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && detachClient(client)) {
        LOG_DEBUG(paIpc, "Client disconnected");
        client->deleteLater();
        emit clientDisconnected();
    }
}

bool SocketServer::detachClient(QLocalSocket* client)
{
    m_dispatching.remove(client);
    return m_readBuffers.remove(client) > 0;
}

void SocketServer::dropClient(QLocalSocket* client)
{
    const bool tracked = detachClient(client);
    client->disconnectFromServer();
    if (tracked) {
        client->deleteLater();
        emit clientDisconnected();
    }
}

QJsonObject SocketServer::dispatch(const QJsonObject& request) const
{
    if (!m_handler) {
        return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("No request handler registered"));
    }
    return m_handler(request);
}

void SocketServer::processBuffer(QLocalSocket* client)
{
    // Handlers may run a nested event loop. Frames that arrive meanwhile are
    // buffered and drained by the call already in progress.
    if (m_dispatching.contains(client)) {
        return;
    }
    m_dispatching.insert(client);

    const QPointer<QLocalSocket> guard(client);
    while (guard && m_readBuffers.contains(client)) {
        std::optional<IpcMessage::DecodeResult> frame = IpcMessage::decode(m_readBuffers[client]);
        if (!frame) {
            break;
        }
        m_readBuffers[client].remove(0, frame->bytesConsumed);

        const QString type = frame->json.value(QStringLiteral("type")).toString();
        if (type != QLatin1String("request")) {
            LOG_WARN(paIpc, "Ignoring frame of type '%s'", qPrintable(type));
            continue;
        }

        const uint64_t id = IpcMessage::requestId(frame->json);
        LOG_DEBUG(paIpc, "Request %s id=%llu",
                  qPrintable(frame->json.value(QStringLiteral("method")).toString()),
                  static_cast<unsigned long long>(id));

        const QJsonObject response = dispatch(frame->json);
        if (!guard || !m_readBuffers.contains(client)) {
            LOG_DEBUG(paIpc, "Client left before reply to id=%llu", static_cast<unsigned long long>(id));
            break;
        }

        const QByteArray reply = IpcMessage::encode(response);
        if (reply.isEmpty()) {
            LOG_ERROR(paIpc, "Reply could not be encoded");
            continue;
        }
        client->write(reply);
        client->flush();
    }

    // A deleted client was already removed by detachClient(), and its address
    // may since belong to a new connection.
    if (guard) {
        m_dispatching.remove(client);
    }
}

} // namespace pa
