#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>

namespace vd {

enum class ServiceErrorCode : int {
    InvalidParams      = 1,
    NotFound           = 4,
    InternalError      = 6,
    ServiceUnavailable = 9,
};

QString serviceErrorCodeToString(ServiceErrorCode code);

enum class InputReadStatus {
    Data,
    Retry,  // interrupted or would block; wait for the next notification
    Closed,
};

// Classifies the return value of read(2) and the errno it left behind.
InputReadStatus classifyInputRead(qint64 bytesRead, int errorNumber);

// Newline-delimited JSON envelopes:
//   {"id": ..., "method": "...", "params": {...}}
//   {"type": "response", "id": ..., "result": {...}}
//   {"type": "error", "id": ..., "error": {"code", "codeString", "message"}}
class ServiceMessage {
public:
    // One compact JSON object followed by '\n'.
    static QByteArray encodeLine(const QJsonObject& json);
    // Returns nullopt, with errorOut set, for anything but a JSON object.
    static std::optional<QJsonObject> decodeLine(const QByteArray& line, QString* errorOut = nullptr);

    static QJsonObject makeRequest(const QJsonValue& id, const QString& method,
                                   const QJsonObject& params = {});
    static QJsonObject makeResponse(const QJsonValue& id, const QJsonObject& result);
    static QJsonObject makeError(const QJsonValue& id, ServiceErrorCode code, const QString& message);

    static constexpr int kMaxLineSize = 4 * 1024 * 1024;
};

} // namespace vd
