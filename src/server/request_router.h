#pragma once
#include <QString>
#include <QList>
#include <QStringList>
#include <optional>

enum class Endpoint {
    Health, Generate, UpstreamStatus, Index, StaticAsset
};

struct Route {
    QString method;
    QString pathPattern;
    Endpoint endpoint;
};

class RequestRouter {
public:
    enum class MatchError { NotFound, MethodNotAllowed };

    void registerDefaults();
    void addRoute(const Route& route);
    std::optional<Route> match(const QString& method, const QString& path) const;

    // NotFound unless some route owns the path under another method
    MatchError explainMiss(const QString& path) const;
    QStringList allowedMethods(const QString& path) const;

private:
    struct InternalRoute {
        QString method;          // "GET", "POST", ... or "*" for any
        QString pathPrefix;      // URL path prefix for matching
        bool wildcard = false;   // true if pathPattern ends with "*"
        Route route;
    };
    QList<InternalRoute> m_routes;

    static bool pathMatches(const InternalRoute& entry, const QString& path);
};
