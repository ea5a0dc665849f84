#pragma once
#include <QString>

struct UpstreamEndpoint {
    QString baseUrl;               // empty = unconfigured
    int generateTimeout = 300000;  // generation can legitimately take minutes
    int statusTimeout = 10000;

    bool isConfigured() const { return !baseUrl.trimmed().isEmpty(); }

    // Joins the base address and an endpoint path without doubling '/'.
    QString urlFor(const QString& path) const {
        QString base = baseUrl.trimmed();
        while (base.endsWith(QLatin1Char('/')))
            base.chop(1);
        return path.startsWith(QLatin1Char('/')) ? base + path : base + QLatin1Char('/') + path;
    }
};

struct ServerOptions {
    QString listenAddress = "127.0.0.1";
    int port = 8000;
    // concurrent generate and status calls; other routes are answered inline
    int workerThreads = 64;
    int maxRequestBytes = 1024 * 1024;
};

struct RelayConfig {
    UpstreamEndpoint upstream;
    ServerOptions server;
    QString staticDir;
    QString logDir;
    QString logLevel = "info";
};
