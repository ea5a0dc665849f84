#include "relay_server.h"
#include "api_handlers.h"
#include "core/log_manager.h"

#include <QHostAddress>
#include <QMetaObject>
#include <QPointer>
#include <QStringList>

namespace {

// room for the request line and headers on top of the body limit
constexpr int kHeaderAllowance = 64 * 1024;

}

// ========================================================================
// Construction / destruction
// ========================================================================

RelayServer::RelayServer(ApiHandlers& handlers, QObject* parent)
    : QObject(parent)
    , m_handlers(handlers)
{
    m_router.registerDefaults();
}

RelayServer::~RelayServer()
{
    stop();
    m_workers.waitForDone();
}

// ========================================================================
// start
// ========================================================================

bool RelayServer::start(const ServerOptions& options)
{
    if (m_server) {
        stop();
    }

    m_options = options;
    m_workers.setMaxThreadCount(qMax(1, options.workerThreads));

    QHostAddress address;
    if (!address.setAddress(options.listenAddress)) {
        if (options.listenAddress == QStringLiteral("localhost")) {
            address = QHostAddress(QHostAddress::LocalHost);
        } else {
            LOG_ERROR("server", QStringLiteral("RelayServer: invalid listen address: %1")
                                    .arg(options.listenAddress));
            return false;
        }
    }

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &RelayServer::onNewConnection);

    const quint16 port = static_cast<quint16>(options.port);
    if (!m_server->listen(address, port)) {
        LOG_ERROR("server", QStringLiteral("RelayServer: failed to listen on %1:%2 - %3")
                                .arg(options.listenAddress)
                                .arg(port)
                                .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO("server", QStringLiteral("RelayServer: listening on http://%1:%2")
                           .arg(options.listenAddress)
                           .arg(m_server->serverPort()));
    emit statusChanged(true);
    return true;
}

// ========================================================================
// stop
// ========================================================================

void RelayServer::stop()
{
    if (!m_server) {
        return;
    }

    // abort() emits disconnected, which edits m_pendingData
    const QList<QTcpSocket*> sockets = m_pendingData.keys();
    m_pendingData.clear();
    for (QTcpSocket* socket : sockets) {
        socket->abort();
    }

    m_server->close();
    // sockets are children of the server and go with it; replies still
    // queued by workers find their QPointer cleared
    delete m_server;
    m_server = nullptr;

    m_workers.waitForDone();

    LOG_INFO("server", QStringLiteral("RelayServer: stopped"));
    emit statusChanged(false);
}

// ========================================================================
// isRunning / serverPort
// ========================================================================

bool RelayServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 RelayServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// onNewConnection
// ========================================================================

void RelayServer::onNewConnection()
{
    while (m_server && m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        m_pendingData.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &RelayServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &RelayServer::onSocketDisconnected);

        LOG_DEBUG("server", QStringLiteral("RelayServer: connection from %1:%2")
                                .arg(socket->peerAddress().toString())
                                .arg(socket->peerPort()));
    }
}

// ========================================================================
// onSocketReadyRead
// ========================================================================

void RelayServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket || !m_pendingData.contains(socket)) {
        return;
    }

    QByteArray& buffer = m_pendingData[socket];
    buffer += socket->readAll();

    const http_message::Frame frame = http_message::inspect(buffer);
    switch (frame.state) {
    case http_message::FrameState::Incomplete:
        if (buffer.size() > m_options.maxRequestBytes + kHeaderAllowance
            || frame.contentLength > m_options.maxRequestBytes) {
            m_pendingData.remove(socket);
            sendHttpResponse(socket, HttpResponse::detail(413, QStringLiteral("request too large")));
        }
        return;
    case http_message::FrameState::Chunked:
        m_pendingData.remove(socket);
        sendHttpResponse(socket, HttpResponse::detail(
                                     501, QStringLiteral("chunked request bodies are not supported")));
        return;
    case http_message::FrameState::Malformed:
        m_pendingData.remove(socket);
        sendHttpResponse(socket, HttpResponse::detail(400, QStringLiteral("malformed request")));
        return;
    case http_message::FrameState::Complete:
        break;
    }

    if (frame.contentLength > m_options.maxRequestBytes) {
        m_pendingData.remove(socket);
        sendHttpResponse(socket, HttpResponse::detail(413, QStringLiteral("request too large")));
        return;
    }

    // one request per connection; anything after it is ignored
    const HttpRequest request = http_message::parseRequest(buffer.left(frame.totalLength()));
    m_pendingData.remove(socket);
    disconnect(socket, &QTcpSocket::readyRead, this, &RelayServer::onSocketReadyRead);

    if (!request.complete) {
        sendHttpResponse(socket, HttpResponse::detail(400, QStringLiteral("malformed request")));
        return;
    }
    handleRequest(socket, request);
}

// ========================================================================
// onSocketDisconnected
// ========================================================================

void RelayServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData.remove(socket);
    socket->deleteLater();
}

// ========================================================================
// handleRequest
// ========================================================================

void RelayServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO("server", QStringLiteral("%1 %2").arg(request.method, request.path));

    // CORS preflight
    if (request.method == QStringLiteral("OPTIONS")) {
        HttpResponse preflight = HttpResponse::raw(QByteArray(), QStringLiteral("text/plain"), 204);
        preflight.headers[QStringLiteral("Access-Control-Allow-Methods")] =
            QStringLiteral("GET, POST, OPTIONS");
        preflight.headers[QStringLiteral("Access-Control-Allow-Headers")] =
            request.headers.value(QStringLiteral("access-control-request-headers"),
                                  QStringLiteral("Content-Type"));
        preflight.headers[QStringLiteral("Access-Control-Max-Age")] = QStringLiteral("600");
        sendHttpResponse(socket, preflight);
        return;
    }

    const auto route = m_router.match(request.method, request.path);
    if (!route) {
        if (m_router.explainMiss(request.path) == RequestRouter::MatchError::MethodNotAllowed) {
            HttpResponse notAllowed = HttpResponse::detail(405, QStringLiteral("Method Not Allowed"));
            notAllowed.headers[QStringLiteral("Allow")] =
                m_router.allowedMethods(request.path).join(QStringLiteral(", "));
            sendHttpResponse(socket, notAllowed);
        } else {
            sendHttpResponse(socket, HttpResponse::detail(404, QStringLiteral("Not Found")));
        }
        return;
    }

    const Endpoint endpoint = route->endpoint;
    if (endpoint != Endpoint::Generate && endpoint != Endpoint::UpstreamStatus) {
        sendHttpResponse(socket, m_handlers.dispatch(endpoint, request));
        return;
    }

    // Outbound calls block for up to minutes, so they run on a worker; the
    // reply is written back on this object's thread.
    QPointer<QTcpSocket> guarded(socket);
    m_workers.start([this, guarded, request, endpoint]() {
        const HttpResponse response = m_handlers.dispatch(endpoint, request);
        QMetaObject::invokeMethod(this, [this, guarded, response]() {
            if (guarded) {
                sendHttpResponse(guarded, response);
            } else {
                LOG_DEBUG("server", QStringLiteral("RelayServer: client left before the reply"));
            }
        }, Qt::QueuedConnection);
    });
}

// ========================================================================
// sendHttpResponse
// ========================================================================

void RelayServer::sendHttpResponse(QTcpSocket* socket, const HttpResponse& response)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    if (response.status >= 400) {
        LOG_DEBUG("server", QStringLiteral("RelayServer: answering %1").arg(response.status));
    }

    socket->write(http_message::serialize(response));
    socket->disconnectFromHost();
}
