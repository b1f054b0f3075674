#include "services/governance/service_message.h"

#include <QJsonDocument>
#include <QJsonParseError>

#include <cerrno>

namespace vd {

QString serviceErrorCodeToString(ServiceErrorCode code)
{
    switch (code) {
    case ServiceErrorCode::InvalidParams:      return QStringLiteral("INVALID_PARAMS");
    case ServiceErrorCode::NotFound:           return QStringLiteral("NOT_FOUND");
    case ServiceErrorCode::InternalError:      return QStringLiteral("INTERNAL_ERROR");
    case ServiceErrorCode::ServiceUnavailable: return QStringLiteral("SERVICE_UNAVAILABLE");
    }
    return QStringLiteral("UNKNOWN");
}

InputReadStatus classifyInputRead(qint64 bytesRead, int errorNumber)
{
    if (bytesRead > 0) {
        return InputReadStatus::Data;
    }
    if (bytesRead == 0) {
        return InputReadStatus::Closed;
    }
    if (errorNumber == EINTR || errorNumber == EAGAIN || errorNumber == EWOULDBLOCK) {
        return InputReadStatus::Retry;
    }
    return InputReadStatus::Closed;
}

QByteArray ServiceMessage::encodeLine(const QJsonObject& json)
{
    QByteArray line = QJsonDocument(json).toJson(QJsonDocument::Compact);
    line.append('\n');
    return line;
}

std::optional<QJsonObject> ServiceMessage::decodeLine(const QByteArray& line, QString* errorOut)
{
    if (line.size() > kMaxLineSize) {
        if (errorOut) {
            *errorOut = QStringLiteral("message exceeds %1 bytes").arg(kMaxLineSize);
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(line.trimmed(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorOut) {
            *errorOut = parseError.errorString();
        }
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (errorOut) {
            *errorOut = QStringLiteral("expected a JSON object");
        }
        return std::nullopt;
    }
    return doc.object();
}

QJsonObject ServiceMessage::makeRequest(const QJsonValue& id, const QString& method,
                                        const QJsonObject& params)
{
    QJsonObject json;
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("method")] = method;
    if (!params.isEmpty()) {
        json[QStringLiteral("params")] = params;
    }
    return json;
}

QJsonObject ServiceMessage::makeResponse(const QJsonValue& id, const QJsonObject& result)
{
    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("response");
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("result")] = result;
    return json;
}

QJsonObject ServiceMessage::makeError(const QJsonValue& id, ServiceErrorCode code,
                                      const QString& message)
{
    QJsonObject errorObj;
    errorObj[QStringLiteral("code")] = static_cast<int>(code);
    errorObj[QStringLiteral("codeString")] = serviceErrorCodeToString(code);
    errorObj[QStringLiteral("message")] = message;

    QJsonObject json;
    json[QStringLiteral("type")] = QStringLiteral("error");
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("error")] = errorObj;
    return json;
}

} // namespace vd
