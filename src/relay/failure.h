#pragma once
#include <QtGlobal>
#include <QString>
#include <QJsonObject>

enum class ErrorKind : quint8 {
    NotConfigured,   // 503
    Unreachable,     // 503
    Timeout,         // 504
    UpstreamError,   // upstream status code
    BadGateway,      // 502
    InvalidInput     // 422
};

struct RelayFailure {
    ErrorKind   kind = ErrorKind::BadGateway;
    QString     message;
    int         upstreamStatus = 0;

    int httpStatus() const;

    // {"detail": message}, the body the caller-facing API answers with
    QJsonObject toJson() const;

    static RelayFailure notConfigured(const QString& msg);
    static RelayFailure unreachable(const QString& msg);
    static RelayFailure timeout(const QString& msg);
    static RelayFailure upstreamError(int status, const QString& msg);
    static RelayFailure badGateway(const QString& msg);
    static RelayFailure invalidInput(const QString& msg);
};

QString errorKindName(ErrorKind kind);
