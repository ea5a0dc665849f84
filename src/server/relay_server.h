#pragma once
#include "http_message.h"
#include "request_router.h"
#include "config/config_types.h"
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QThreadPool>
#include <QMap>

class ApiHandlers;

class RelayServer : public QObject {
    Q_OBJECT
public:
    explicit RelayServer(ApiHandlers& handlers, QObject* parent = nullptr);
    ~RelayServer() override;

    bool start(const ServerOptions& options);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void sendHttpResponse(QTcpSocket* socket, const HttpResponse& response);

    ApiHandlers& m_handlers;
    QTcpServer* m_server = nullptr;
    QThreadPool m_workers;
    RequestRouter m_router;
    ServerOptions m_options;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
};
