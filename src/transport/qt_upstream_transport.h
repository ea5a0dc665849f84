#pragma once
#include "relay/ports.h"
#include <QNetworkReply>
#include <QNetworkRequest>

// Performs each exchange on its own QNetworkAccessManager inside a local
// event loop, so it may be called from any thread that has no running loop
// of its own, including QThreadPool workers.
class QtUpstreamTransport : public IUpstreamTransport {
public:
    QtUpstreamTransport() = default;

    Result<UpstreamResponse> execute(const UpstreamRequest& request) override;

    static RelayFailure classifyNetworkError(QNetworkReply::NetworkError error,
                                             const QString& errorString,
                                             const QString& url);

private:
    QNetworkRequest buildQtRequest(const UpstreamRequest& request) const;
};
