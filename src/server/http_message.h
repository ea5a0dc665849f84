#pragma once
#include <QByteArray>
#include <QJsonObject>
#include <QMap>
#include <QString>

struct HttpRequest {
    QString method, path, query, httpVersion;
    QMap<QString, QString> headers;  // keys lower-cased
    QByteArray body;
    bool complete = false;
};

struct HttpResponse {
    int status = 200;
    QString contentType = QStringLiteral("application/json");
    QMap<QString, QString> headers;
    QByteArray body;

    static HttpResponse json(const QJsonObject& obj, int status = 200);
    static HttpResponse raw(const QByteArray& body, const QString& contentType, int status = 200);
    static HttpResponse detail(int status, const QString& message);
};

namespace http_message {

enum class FrameState { Incomplete, Complete, Chunked, Malformed };

// Looks at the head of a connection buffer and decides whether a whole
// request (header block plus Content-Length body) is present.
struct Frame {
    FrameState state = FrameState::Incomplete;
    int headerLength = 0;
    int contentLength = 0;
    int totalLength() const { return headerLength + contentLength; }
};

Frame inspect(const QByteArray& buffer);
HttpRequest parseRequest(const QByteArray& data);
QByteArray serialize(const HttpResponse& response);
QString statusText(int status);

}
