#include "core/ipc/message.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QtEndian>

#include <cstring>

namespace nr {

QByteArray IpcMessage::encode(const QJsonObject& json)
{
    const QByteArray payload = QJsonDocument(json).toJson(QJsonDocument::Compact);
    if (payload.size() > kMaxMessageSize) {
        qCWarning(nrIpc, "Refusing to encode %d byte message (limit %d)",
                  static_cast<int>(payload.size()), kMaxMessageSize);
        return {};
    }

    QByteArray frame;
    frame.reserve(kHeaderSize + payload.size());
    const quint32 length = qToBigEndian(static_cast<quint32>(payload.size()));
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
        qCWarning(nrIpc, "Frame length %u exceeds limit %d", payloadLength, kMaxMessageSize);
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
        qCWarning(nrIpc, "Malformed frame: %s", qPrintable(parseError.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        qCWarning(nrIpc, "Frame payload is not a JSON object");
        return std::nullopt;
    }

    return DecodeResult{doc.object(), frameLength};
}

QJsonObject IpcMessage::makeRequest(uint64_t id, const QString& method, const QJsonObject& params)
{
    QJsonObject json{
        {QStringLiteral("type"), QStringLiteral("request")},
        {QStringLiteral("id"), static_cast<qint64>(id)},
        {QStringLiteral("method"), method},
    };
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject IpcMessage::makeResponse(uint64_t id, const QJsonObject& result)
{
    return QJsonObject{
        {QStringLiteral("type"), QStringLiteral("response")},
        {QStringLiteral("id"), static_cast<qint64>(id)},
        {QStringLiteral("result"), result},
    };
}

QJsonObject IpcMessage::makeError(uint64_t id, IpcErrorCode code, const QString& message)
{
    const QJsonObject error{
        {QStringLiteral("code"), static_cast<int>(code)},
        {QStringLiteral("codeString"), ipcErrorCodeToString(code)},
        {QStringLiteral("message"), message},
    };
    return QJsonObject{
        {QStringLiteral("type"), QStringLiteral("error")},
        {QStringLiteral("id"), static_cast<qint64>(id)},
        {QStringLiteral("error"), error},
    };
}

QJsonObject IpcMessage::makeNotification(const QString& method, const QJsonObject& params)
{
    QJsonObject json{
        {QStringLiteral("type"), QStringLiteral("notification")},
        {QStringLiteral("method"), method},
    };
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

uint64_t IpcMessage::requestId(const QJsonObject& message)
{
    return static_cast<uint64_t>(message.value(QStringLiteral("id")).toInteger());
}

QString IpcMessage::method(const QJsonObject& message)
{
    return message.value(QStringLiteral("method")).toString();
}

QJsonObject IpcMessage::params(const QJsonObject& message)
{
    return message.value(QStringLiteral("params")).toObject();
}

bool IpcMessage::isError(const QJsonObject& message)
{
    return message.value(QStringLiteral("type")).toString() == QLatin1String("error");
}

QString IpcMessage::errorMessage(const QJsonObject& message)
{
    return message.value(QStringLiteral("error")).toObject()
        .value(QStringLiteral("message")).toString();
}

} // namespace nr
