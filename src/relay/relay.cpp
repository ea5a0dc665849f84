#include "relay.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <utility>

Relay::Relay(UpstreamEndpoint endpoint, IUpstreamTransport& transport)
    : m_endpoint(std::move(endpoint))
    , m_transport(transport)
{
}

QString Relay::describeStatus(const UpstreamResponse& response, const QString& url)
{
    const int status = response.statusCode;
    QString kind;
    if (status >= 400 && status < 500)
        kind = QStringLiteral("Client error");
    else if (status >= 500 && status < 600)
        kind = QStringLiteral("Server error");
    else if (status >= 300 && status < 400)
        kind = QStringLiteral("Redirect response");
    else
        kind = QStringLiteral("Unexpected status");

    const QString line = response.reasonPhrase.isEmpty()
                             ? QString::number(status)
                             : QStringLiteral("%1 %2").arg(status).arg(response.reasonPhrase);
    return QStringLiteral("%1 '%2' for url '%3'").arg(kind, line, url);
}

Result<GenerationResult> Relay::generate(const QString& prompt)
{
    if (!m_endpoint.isConfigured()) {
        return std::unexpected(RelayFailure::notConfigured(
            QStringLiteral("COLAB_API_URL not configured. Add it to the environment or the .env file.")));
    }

    QJsonObject payload;
    payload[QStringLiteral("prompt")] = prompt;

    UpstreamRequest request;
    request.method = QStringLiteral("POST");
    request.url = m_endpoint.urlFor(QStringLiteral("/generate"));
    request.body = QJsonDocument(payload).toJson(QJsonDocument::Compact);
    request.timeoutMs = m_endpoint.generateTimeout;

    LOG_INFO("relay", QStringLiteral("forwarding prompt (%1 chars) to %2")
                          .arg(prompt.size())
                          .arg(request.url));

    auto result = m_transport.execute(request);
    if (!result) {
        RelayFailure failure = result.error();
        switch (failure.kind) {
        case ErrorKind::Unreachable:
            failure.message = QStringLiteral("Cannot connect to the model server. "
                                             "Make sure it is running. (%1)").arg(failure.message);
            break;
        case ErrorKind::Timeout:
            failure.message = QStringLiteral("Model server timed out. Generation can take "
                                             "several minutes, please try again. (%1)").arg(failure.message);
            break;
        default:
            break;
        }
        LOG_WARNING("relay", QStringLiteral("generate failed: %1 %2")
                                 .arg(errorKindName(failure.kind), failure.message));
        return std::unexpected(failure);
    }

    const UpstreamResponse& response = *result;
    if (!response.isSuccess()) {
        LOG_WARNING("relay", QStringLiteral("upstream answered %1, body: %2")
                                 .arg(response.statusCode)
                                 .arg(QString::fromUtf8(response.body.left(512))));
        return std::unexpected(RelayFailure::upstreamError(
            response.statusCode, describeStatus(response, request.url)));
    }

    GenerationResult generated;
    generated.body = response.body;
    generated.contentType = response.header(QStringLiteral("Content-Type"));
    LOG_INFO("relay", QStringLiteral("upstream answered %1 (%2 bytes)")
                          .arg(response.statusCode)
                          .arg(response.body.size()));
    return generated;
}
