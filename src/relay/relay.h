#pragma once
#include "ports.h"
#include "config/config_types.h"

struct GenerationResult {
    QByteArray body;        // upstream payload, unmodified
    QString contentType;
};

// Forwards a prompt to <base>/generate. One attempt per call, no retries.
class Relay {
public:
    Relay(UpstreamEndpoint endpoint, IUpstreamTransport& transport);

    Result<GenerationResult> generate(const QString& prompt);

    const UpstreamEndpoint& endpoint() const { return m_endpoint; }

    static QString describeStatus(const UpstreamResponse& response, const QString& url);

private:
    const UpstreamEndpoint m_endpoint;
    IUpstreamTransport& m_transport;
};
