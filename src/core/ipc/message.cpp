#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace pa {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        LOG_WARN(paIpc, "Refusing to encode %d byte frame (max %d)",
                 static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    const quint32 length = qToBigEndian(static_cast<quint32>(payload.size()));

    QByteArray frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.append(reinterpret_cast<const char*>(&length), kHeaderSize);
    frame.append(payload);
    return frame;
}

std::optional<IpcMessage::DecodeResult> IpcMessage::decode(const QByteArray& buffer)
{
    if (buffer.size() < kHeaderSize) {
        return std::nullopt;
    }

    quint32 rawLength = 0;
    std::memcpy(&rawLength, buffer.constData(), kHeaderSize);
    const quint32 payloadLength = qFromBigEndian(rawLength);
    if (payloadLength > static_cast<quint32>(kMaxMessageSize)) {
        LOG_WARN(paIpc, "Frame length %u exceeds max %d", payloadLength, kMaxMessageSize);
        return std::nullopt;
    }

    const int frameLength = kHeaderSize + static_cast<int>(payloadLength);
    if (buffer.size() < frameLength) {
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(
        buffer.mid(kHeaderSize, static_cast<int>(payloadLength)), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(paIpc, "Malformed frame: %s", qPrintable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        LOG_WARN(paIpc, "Frame payload is not a JSON object");
        return std::nullopt;
    }

    DecodeResult result;
    result.json = doc.object();
    result.bytesConsumed = frameLength;
    return result;
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("request");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    QJsonObject error;
    error[QStringLiteral("code")] = static_cast<int>(code);
    error[QStringLiteral("codeString")] = ipcErrorCodeToString(code);
    error[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("error")] = error;
    return json;
}

uint64_t IpcMessage::requestId(const QJsonObject& request)
{
    return static_cast<uint64_t>(request.value(QStringLiteral("id")).toInteger());
}

QJsonObject IpcMessage::params(const QJsonObject& request)
{
    return request.value(QStringLiteral("params")).toObject();
}

} // namespace pa
