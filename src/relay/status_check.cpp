#include "status_check.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonParseError>
#include <utility>

QJsonObject StatusResult::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("online")] = online;
    if (online)
        obj[QStringLiteral("detail")] = detail;
    else
        obj[QStringLiteral("reason")] = reason;
    return obj;
}

StatusCheck::StatusCheck(UpstreamEndpoint endpoint, IUpstreamTransport& transport)
    : m_endpoint(std::move(endpoint))
    , m_transport(transport)
{
}

StatusResult StatusCheck::offline(const QString& reason)
{
    StatusResult result;
    result.online = false;
    result.reason = reason.isEmpty() ? QStringLiteral("unknown failure") : reason;
    return result;
}

StatusResult StatusCheck::check()
{
    if (!m_endpoint.isConfigured())
        return offline(QStringLiteral("not configured"));

    UpstreamRequest request;
    request.method = QStringLiteral("GET");
    request.url = m_endpoint.urlFor(QStringLiteral("/health"));
    request.timeoutMs = m_endpoint.statusTimeout;

    auto result = m_transport.execute(request);
    if (!result) {
        LOG_DEBUG("status", QStringLiteral("upstream offline: %1").arg(result.error().message));
        return offline(result.error().message);
    }

    const UpstreamResponse& response = *result;
    // a JSON answer means the server is up, whatever its status code
    if (!response.isSuccess())
        LOG_DEBUG("status", QStringLiteral("upstream health answered %1").arg(response.statusCode));

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(response.body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return offline(QStringLiteral("malformed health response from %1: %2")
                           .arg(request.url, parseError.errorString()));
    }

    StatusResult status;
    status.online = true;
    if (doc.isObject())
        status.detail = doc.object();
    else
        status.detail = doc.array();
    return status;
}
