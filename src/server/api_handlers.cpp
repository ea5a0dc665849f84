#include "api_handlers.h"
#include "static_files.h"
#include "relay/relay.h"
#include "relay/status_check.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

ApiHandlers::ApiHandlers(Relay& relay, StatusCheck& statusCheck, const StaticFiles& staticFiles)
    : m_relay(relay)
    , m_statusCheck(statusCheck)
    , m_staticFiles(staticFiles)
{
}

HttpResponse ApiHandlers::dispatch(Endpoint endpoint, const HttpRequest& request)
{
    switch (endpoint) {
    case Endpoint::Health:         return health();
    case Endpoint::Generate:       return generate(request);
    case Endpoint::UpstreamStatus: return upstreamStatus();
    case Endpoint::Index:          return index();
    case Endpoint::StaticAsset:
        return staticAsset(request.path.mid(QStringLiteral("/static/").size()));
    }
    return HttpResponse::detail(404, QStringLiteral("Not Found"));
}

HttpResponse ApiHandlers::health() const
{
    QJsonObject obj;
    obj[QStringLiteral("status")] = QStringLiteral("ok");
    obj[QStringLiteral("colab_url_configured")] = m_relay.endpoint().isConfigured();
    return HttpResponse::json(obj);
}

HttpResponse ApiHandlers::generate(const HttpRequest& request)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(request.body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return HttpResponse::json(
            RelayFailure::invalidInput(QStringLiteral("request body must be a JSON object"))
                .toJson(),
            422);
    }

    const QJsonValue prompt = doc.object().value(QStringLiteral("prompt"));
    if (!prompt.isString()) {
        return HttpResponse::json(
            RelayFailure::invalidInput(QStringLiteral("field 'prompt' is required and must be a string"))
                .toJson(),
            422);
    }

    auto result = m_relay.generate(prompt.toString());
    if (!result) {
        const RelayFailure& failure = result.error();
        return HttpResponse::json(failure.toJson(), failure.httpStatus());
    }

    // the upstream body is relayed verbatim
    const QString contentType = result->contentType.isEmpty() ? QStringLiteral("application/json")
                                                              : result->contentType;
    return HttpResponse::raw(result->body, contentType);
}

HttpResponse ApiHandlers::upstreamStatus()
{
    return HttpResponse::json(m_statusCheck.check().toJson());
}

HttpResponse ApiHandlers::index() const
{
    return m_staticFiles.serveIndex();
}

HttpResponse ApiHandlers::staticAsset(const QString& path) const
{
    return m_staticFiles.serve(path);
}
