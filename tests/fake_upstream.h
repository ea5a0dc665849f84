#pragma once
#include "server/http_message.h"
#include <QHostAddress>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>

// Minimal upstream model server living on 127.0.0.1 in the test's thread.
// Connections use lambdas only, so the class needs no moc pass.
class FakeUpstream : public QObject {
public:
    enum class Mode { Respond, Silent, CloseEarly };

    explicit FakeUpstream(QObject* parent = nullptr)
        : QObject(parent)
    {
        connect(&m_server, &QTcpServer::newConnection, this, [this]() { onNewConnection(); });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost, 0); }
    QString baseUrl() const {
        return QStringLiteral("http://127.0.0.1:%1").arg(m_server.serverPort());
    }

    void setMode(Mode mode) { m_mode = mode; }
    void setResponse(int status, const QByteArray& body) {
        m_status = status;
        m_body = body;
    }

    int requestCount() const { return m_requestCount; }
    const HttpRequest& lastRequest() const { return m_lastRequest; }

private:
    void onNewConnection() {
        while (m_server.hasPendingConnections()) {
            QTcpSocket* socket = m_server.nextPendingConnection();
            connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
            connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    }

    void onReadyRead(QTcpSocket* socket) {
        QByteArray& buffer = m_buffers[socket];
        buffer += socket->readAll();
        const auto frame = http_message::inspect(buffer);
        if (frame.state != http_message::FrameState::Complete)
            return;

        m_lastRequest = http_message::parseRequest(buffer.left(frame.totalLength()));
        m_buffers.remove(socket);
        ++m_requestCount;

        switch (m_mode) {
        case Mode::Silent:
            return;
        case Mode::CloseEarly:
            socket->abort();
            return;
        case Mode::Respond:
            break;
        }

        QByteArray wire = QStringLiteral("HTTP/1.1 %1 %2\r\n")
                              .arg(m_status)
                              .arg(http_message::statusText(m_status))
                              .toUtf8();
        wire += "Content-Type: application/json\r\n";
        wire += "Content-Length: " + QByteArray::number(m_body.size()) + "\r\n";
        wire += "Connection: close\r\n\r\n";
        wire += m_body;
        socket->write(wire);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    Mode m_mode = Mode::Respond;
    int m_status = 200;
    QByteArray m_body = QByteArrayLiteral("{}");
    int m_requestCount = 0;
    HttpRequest m_lastRequest;
    QMap<QTcpSocket*, QByteArray> m_buffers;
};
