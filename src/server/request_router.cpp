#include "request_router.h"
#include "core/log_manager.h"
#include <QStringList>

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    addRoute({QStringLiteral("GET"), QStringLiteral("/health"), Endpoint::Health});
    addRoute({QStringLiteral("POST"), QStringLiteral("/api/generate"), Endpoint::Generate});
    addRoute({QStringLiteral("GET"), QStringLiteral("/api/colab-status"), Endpoint::UpstreamStatus});
    addRoute({QStringLiteral("GET"), QStringLiteral("/"), Endpoint::Index});

    // GET /static/* -> files under the static directory
    addRoute({QStringLiteral("GET"), QStringLiteral("/static/*"), Endpoint::StaticAsset});

    LOG_DEBUG("server", QStringLiteral("RequestRouter: registered %1 default routes")
                            .arg(m_routes.size()));
}

void RequestRouter::addRoute(const Route& route)
{
    InternalRoute entry;
    entry.route = route;
    entry.method = route.method.trimmed().toUpper();

    // Handle wildcard paths: "/some/prefix/*"
    if (route.pathPattern.endsWith(QLatin1Char('*'))) {
        entry.wildcard = true;
        entry.pathPrefix = route.pathPattern.left(route.pathPattern.size() - 1);
    } else {
        entry.wildcard = false;
        entry.pathPrefix = route.pathPattern;
    }

    m_routes.append(entry);
}

bool RequestRouter::pathMatches(const InternalRoute& entry, const QString& path)
{
    if (entry.wildcard)
        return path.startsWith(entry.pathPrefix) && path.size() > entry.pathPrefix.size();
    return path == entry.pathPrefix;
}

std::optional<Route> RequestRouter::match(const QString& method, const QString& path) const
{
    const QString normalizedMethod = method.trimmed().toUpper();

    for (const InternalRoute& entry : m_routes) {
        if (entry.method != QStringLiteral("*") && entry.method != normalizedMethod)
            continue;
        if (pathMatches(entry, path))
            return entry.route;
    }

    return std::nullopt;
}

RequestRouter::MatchError RequestRouter::explainMiss(const QString& path) const
{
    return allowedMethods(path).isEmpty() ? MatchError::NotFound : MatchError::MethodNotAllowed;
}

QStringList RequestRouter::allowedMethods(const QString& path) const
{
    QStringList methods;
    for (const InternalRoute& entry : m_routes) {
        if (pathMatches(entry, path) && !methods.contains(entry.method))
            methods.append(entry.method);
    }
    return methods;
}
