#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QTimer>

#include <atomic>
#include <csignal>

#include "config/config_store.h"
#include "core/log_manager.h"
#include "relay/relay.h"
#include "relay/status_check.h"
#include "server/api_handlers.h"
#include "server/relay_server.h"
#include "server/static_files.h"
#include "transport/qt_upstream_transport.h"

namespace {

std::atomic<bool> g_shutdownRequested{false};

void onTerminationSignal(int)
{
    g_shutdownRequested = true;
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("promptrelay"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Command line ---
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Local HTTP relay between a frontend and a remote model server"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption envFileOption(QStringLiteral("env-file"),
                                     QStringLiteral("Read settings from <path> (default: .env)."),
                                     QStringLiteral("path"), QStringLiteral(".env"));
    QCommandLineOption hostOption(QStringLiteral("host"),
                                  QStringLiteral("Listen address (overrides RELAY_HOST)."),
                                  QStringLiteral("address"));
    QCommandLineOption portOption(QStringLiteral("port"),
                                  QStringLiteral("Listen port (overrides RELAY_PORT)."),
                                  QStringLiteral("port"));
    parser.addOption(envFileOption);
    parser.addOption(hostOption);
    parser.addOption(portOption);
    parser.process(app);

    // --- 2. Config + Log ---
    ConfigStore configStore;
    const QString envFile = QDir::current().absoluteFilePath(parser.value(envFileOption));
    const bool envLoaded = configStore.load(envFile);
    if (parser.isSet(hostOption))
        configStore.overrideListenAddress(parser.value(hostOption));
    if (parser.isSet(portOption)) {
        bool ok = false;
        const int port = parser.value(portOption).toInt(&ok);
        if (!ok) {
            LOG_ERROR("config", QStringLiteral("--port expects a number, got '%1'")
                                    .arg(parser.value(portOption)));
            return 2;
        }
        configStore.overridePort(port);
    }

    const RelayConfig config = configStore.relayConfig();
    LogManager::instance().initialize(config.logDir,
                                      LogManager::levelFromString(config.logLevel));
    LOG_INFO("app", QStringLiteral("promptrelay %1 starting").arg(app.applicationVersion()));
    if (envLoaded)
        LOG_INFO("config", QStringLiteral("loaded %1").arg(envFile));

    if (config.upstream.isConfigured()) {
        LOG_INFO("config", QStringLiteral("upstream: %1").arg(config.upstream.baseUrl));
    } else {
        LOG_WARNING("config", QStringLiteral("COLAB_API_URL is not set; generation and status "
                                             "calls will report 'not configured'"));
    }

    // --- 3. Components ---
    QtUpstreamTransport transport;
    Relay relay(config.upstream, transport);
    StatusCheck statusCheck(config.upstream, transport);
    StaticFiles staticFiles(config.staticDir);
    LOG_INFO("static", QStringLiteral("serving static files from %1").arg(staticFiles.rootDir()));

    ApiHandlers handlers(relay, statusCheck, staticFiles);

    // --- 4. Server ---
    RelayServer server(handlers);
    if (!server.start(config.server)) {
        LOG_ERROR("app", QStringLiteral("failed to start server"));
        return 1;
    }

    // --- 5. Shutdown on SIGINT / SIGTERM ---
    std::signal(SIGINT, onTerminationSignal);
    std::signal(SIGTERM, onTerminationSignal);
    QTimer shutdownPoll;
    QObject::connect(&shutdownPoll, &QTimer::timeout, &app, [&app]() {
        if (g_shutdownRequested)
            app.quit();
    });
    shutdownPoll.start(200);

    const int rc = app.exec();
    server.stop();
    LOG_INFO("app", QStringLiteral("promptrelay stopped"));
    return rc;
}
