#include "qt_upstream_transport.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QTimer>
#include <QUrl>
#include <memory>

QNetworkRequest QtUpstreamTransport::buildQtRequest(const UpstreamRequest& request) const {
    QNetworkRequest req{QUrl{request.url}};

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!request.body.isEmpty() && !req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    if (!req.hasRawHeader("Accept"))
        req.setRawHeader("Accept", "application/json");

    // 3xx answers are reported to the caller as they are
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::ManualRedirectPolicy);
    return req;
}

RelayFailure QtUpstreamTransport::classifyNetworkError(QNetworkReply::NetworkError error,
                                                       const QString& errorString,
                                                       const QString& url) {
    switch (error) {
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::SslHandshakeFailedError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProtocolUnknownError:
        return RelayFailure::unreachable(QStringLiteral("cannot connect to %1: %2")
                                             .arg(url, errorString));
    case QNetworkReply::TimeoutError:
    case QNetworkReply::ProxyTimeoutError:
        return RelayFailure::timeout(QStringLiteral("%1 timed out: %2").arg(url, errorString));
    default:
        return RelayFailure::badGateway(QStringLiteral("exchange with %1 failed: %2")
                                            .arg(url, errorString));
    }
}

Result<UpstreamResponse> QtUpstreamTransport::execute(const UpstreamRequest& request) {
    const QUrl url(request.url);
    if (!url.isValid() || url.scheme().isEmpty() || url.host().isEmpty()) {
        return std::unexpected(RelayFailure::unreachable(
            QStringLiteral("cannot connect: invalid upstream url '%1'").arg(request.url)));
    }

    QNetworkAccessManager nam;
    const QNetworkRequest req = buildQtRequest(request);

    // declared after nam so the reply goes first on every exit path
    std::unique_ptr<QNetworkReply> reply;
    const QString method = request.method.trimmed().toUpper();
    if (method == "POST")
        reply.reset(nam.post(req, request.body));
    else if (method == "GET")
        reply.reset(nam.get(req));
    else
        reply.reset(nam.sendCustomRequest(req, method.toUtf8(), request.body));

    LOG_DEBUG("transport", QStringLiteral("%1 %2 (timeout %3 ms)")
                               .arg(method, request.url)
                               .arg(request.timeoutMs));

    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, &loop, &QEventLoop::quit);
    deadline.start(request.timeoutMs);
    if (!reply->isFinished())
        loop.exec();

    if (reply->isRunning()) {
        reply->abort();
        LOG_WARNING("transport", QStringLiteral("%1 %2 exceeded %3 ms")
                                     .arg(method, request.url)
                                     .arg(request.timeoutMs));
        return std::unexpected(RelayFailure::timeout(
            QStringLiteral("%1 timed out after %2 ms").arg(request.url).arg(request.timeoutMs)));
    }

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (statusAttr.isValid() && statusAttr.toInt() > 0) {
        UpstreamResponse resp;
        resp.statusCode = statusAttr.toInt();
        resp.reasonPhrase = reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        resp.body = reply->readAll();
        for (const auto& header : reply->rawHeaderList())
            resp.headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));

        LOG_DEBUG("transport", QStringLiteral("%1 %2 -> %3 (%4 bytes)")
                                   .arg(method, request.url)
                                   .arg(resp.statusCode)
                                   .arg(resp.body.size()));
        return resp;
    }

    const RelayFailure failure =
        classifyNetworkError(reply->error(), reply->errorString(), request.url);
    LOG_WARNING("transport", QStringLiteral("%1 %2 failed: %3 (%4)")
                                 .arg(method, request.url, errorKindName(failure.kind),
                                      reply->errorString()));
    return std::unexpected(failure);
}
