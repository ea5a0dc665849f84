#pragma once
#include "failure.h"
#include <expected>
#include <QByteArray>
#include <QMap>
#include <QString>

template<typename T>
using Result = std::expected<T, RelayFailure>;

struct UpstreamRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    int timeoutMs = 10000;
};

struct UpstreamResponse {
    int statusCode = 0;
    QString reasonPhrase;
    QMap<QString, QString> headers;
    QByteArray body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
    QString header(const QString& name) const {
        for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
            if (it.key().compare(name, Qt::CaseInsensitive) == 0)
                return it.value();
        }
        return QString();
    }
};

// One outbound HTTP exchange. Any HTTP response, whatever its status, is a
// value; only failures to complete the exchange are errors.
class IUpstreamTransport {
public:
    virtual ~IUpstreamTransport() = default;
    virtual Result<UpstreamResponse> execute(const UpstreamRequest& request) = 0;
};
