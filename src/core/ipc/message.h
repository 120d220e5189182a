#pragma once

#include "core/shared/ipc_messages.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>

namespace nr {

// Wire framing for the engine's local socket protocol.
//
// Every frame is a 4-byte big-endian payload length followed by one compact
// UTF-8 JSON object. Objects carry "type" (request, response, error,
// notification), an "id" that pairs responses with requests, and either
// "method"/"params", "result" or "error".
class IpcMessage {
public:
    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxMessageSize = 16 * 1024 * 1024;

    // Returns an empty array when the payload exceeds kMaxMessageSize.
    static QByteArray encode(const QJsonObject& json);

    struct DecodeResult {
        QJsonObject json;
        int bytesConsumed = 0;
    };
    // nullopt while the buffer holds no complete frame, or the frame is invalid.
    static std::optional<DecodeResult> decode(const QByteArray& buffer);

    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);
    static QJsonObject makeNotification(const QString& method, const QJsonObject& params = {});

    // ── Accessors ───────────────────────────────────────────
    static uint64_t requestId(const QJsonObject& message);
    static QString method(const QJsonObject& message);
    static QJsonObject params(const QJsonObject& message);
    static bool isError(const QJsonObject& message);
    static QString errorMessage(const QJsonObject& message);
};

} // namespace nr
