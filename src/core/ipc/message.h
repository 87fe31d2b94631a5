#pragma once

#include "core/shared/ipc_messages.h"

#include <QByteArray>
#include <QJsonObject>

#include <cstdint>
#include <optional>

namespace pa {

// Frames are a 4-byte big-endian payload length followed by compact UTF-8 JSON.
class IpcMessage {
public:
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        QJsonObject json;
        int bytesConsumed = 0;
    };
    // nullopt until the buffer holds one complete frame.
    static std::optional<DecodeResult> decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);

    static uint64_t requestId(const QJsonObject& request);
    static QJsonObject params(const QJsonObject& request);

    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxMessageSize = 4 * 1024 * 1024;
};

} // namespace pa
