#include "http_message.h"
#include <QJsonDocument>
#include <QStringList>
#include <QUrl>

HttpResponse HttpResponse::json(const QJsonObject& obj, int status)
{
    HttpResponse resp;
    resp.status = status;
    resp.contentType = QStringLiteral("application/json");
    resp.body = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    return resp;
}

HttpResponse HttpResponse::raw(const QByteArray& body, const QString& contentType, int status)
{
    HttpResponse resp;
    resp.status = status;
    resp.contentType = contentType;
    resp.body = body;
    return resp;
}

HttpResponse HttpResponse::detail(int status, const QString& message)
{
    QJsonObject obj;
    obj[QStringLiteral("detail")] = message;
    return json(obj, status);
}

namespace http_message {

Frame inspect(const QByteArray& buffer)
{
    Frame frame;
    const int headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return frame;

    frame.headerLength = headerEnd + 4;
    const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
    const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
    for (const QString& line : headerLines) {
        if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
            bool ok = false;
            const int length = line.mid(15).trimmed().toInt(&ok);
            if (!ok || length < 0) {
                frame.state = FrameState::Malformed;
                return frame;
            }
            frame.contentLength = length;
        }
        if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
            && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
            frame.state = FrameState::Chunked;
            return frame;
        }
    }

    frame.state = buffer.size() >= frame.totalLength() ? FrameState::Complete
                                                       : FrameState::Incomplete;
    return frame;
}

HttpRequest parseRequest(const QByteArray& data)
{
    HttpRequest req;

    const int headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return req;

    const QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    const QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Request line: "METHOD TARGET HTTP/1.1"
    if (lines.isEmpty())
        return req;
    const QStringList parts = lines[0].split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() < 3)
        return req;

    req.method = parts[0].trimmed().toUpper();
    req.httpVersion = parts[2].trimmed();

    const QString target = parts[1];
    const int queryStart = target.indexOf(QLatin1Char('?'));
    const QString rawPath = queryStart >= 0 ? target.left(queryStart) : target;
    req.query = queryStart >= 0 ? target.mid(queryStart + 1) : QString();
    req.path = QUrl::fromPercentEncoding(rawPath.toUtf8());

    for (int i = 1; i < lines.size(); ++i) {
        const int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            const QString key = lines[i].left(colon).trimmed().toLower();
            const QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    req.body = data.mid(headerEnd + 4);
    req.complete = true;
    return req;
}

QString statusText(int status)
{
    switch (status) {
    case 200: return QStringLiteral("OK");
    case 201: return QStringLiteral("Created");
    case 204: return QStringLiteral("No Content");
    case 400: return QStringLiteral("Bad Request");
    case 401: return QStringLiteral("Unauthorized");
    case 403: return QStringLiteral("Forbidden");
    case 404: return QStringLiteral("Not Found");
    case 405: return QStringLiteral("Method Not Allowed");
    case 413: return QStringLiteral("Payload Too Large");
    case 422: return QStringLiteral("Unprocessable Entity");
    case 429: return QStringLiteral("Too Many Requests");
    case 500: return QStringLiteral("Internal Server Error");
    case 501: return QStringLiteral("Not Implemented");
    case 502: return QStringLiteral("Bad Gateway");
    case 503: return QStringLiteral("Service Unavailable");
    case 504: return QStringLiteral("Gateway Timeout");
    default:  return QStringLiteral("Unknown");
    }
}

QByteArray serialize(const HttpResponse& response)
{
    QByteArray out;
    out.append(QStringLiteral("HTTP/1.1 %1 %2\r\n")
                   .arg(response.status)
                   .arg(statusText(response.status))
                   .toUtf8());
    if (response.status != 204) {
        out.append(QStringLiteral("Content-Type: %1\r\n").arg(response.contentType).toUtf8());
        out.append(QStringLiteral("Content-Length: %1\r\n").arg(response.body.size()).toUtf8());
    }
    out.append("Access-Control-Allow-Origin: *\r\n");
    for (auto it = response.headers.constBegin(); it != response.headers.constEnd(); ++it)
        out.append(QStringLiteral("%1: %2\r\n").arg(it.key(), it.value()).toUtf8());
    out.append("Connection: close\r\n");
    out.append("\r\n");
    if (response.status != 204)
        out.append(response.body);
    return out;
}

}
