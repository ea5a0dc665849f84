#pragma once
#include "ports.h"
#include "config/config_types.h"
#include <QJsonObject>
#include <QJsonValue>

struct StatusResult {
    bool online = false;
    QJsonValue detail;  // upstream health payload, when online
    QString reason;     // non-empty when offline

    QJsonObject toJson() const;
};

// Probes <base>/health. Never fails: every failure becomes online == false.
class StatusCheck {
public:
    StatusCheck(UpstreamEndpoint endpoint, IUpstreamTransport& transport);

    StatusResult check();

private:
    const UpstreamEndpoint m_endpoint;
    IUpstreamTransport& m_transport;

    static StatusResult offline(const QString& reason);
};
