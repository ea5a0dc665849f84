#include "failure.h"

int RelayFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::NotConfigured: return 503;
    case ErrorKind::Unreachable:   return 503;
    case ErrorKind::Timeout:       return 504;
    case ErrorKind::InvalidInput:  return 422;
    case ErrorKind::UpstreamError:
        return (upstreamStatus >= 100 && upstreamStatus <= 599) ? upstreamStatus : 502;
    case ErrorKind::BadGateway:
    default:                       return 502;
    }
}

QJsonObject RelayFailure::toJson() const {
    QJsonObject root;
    root["detail"] = message;
    return root;
}

RelayFailure RelayFailure::notConfigured(const QString& msg) {
    return {ErrorKind::NotConfigured, msg, 0};
}

RelayFailure RelayFailure::unreachable(const QString& msg) {
    return {ErrorKind::Unreachable, msg, 0};
}

RelayFailure RelayFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, msg, 0};
}

RelayFailure RelayFailure::upstreamError(int status, const QString& msg) {
    return {ErrorKind::UpstreamError, msg, status};
}

RelayFailure RelayFailure::badGateway(const QString& msg) {
    return {ErrorKind::BadGateway, msg, 0};
}

RelayFailure RelayFailure::invalidInput(const QString& msg) {
    return {ErrorKind::InvalidInput, msg, 0};
}

QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotConfigured: return QStringLiteral("NotConfigured");
    case ErrorKind::Unreachable:   return QStringLiteral("Unreachable");
    case ErrorKind::Timeout:       return QStringLiteral("Timeout");
    case ErrorKind::UpstreamError: return QStringLiteral("UpstreamError");
    case ErrorKind::BadGateway:    return QStringLiteral("BadGateway");
    case ErrorKind::InvalidInput:  return QStringLiteral("InvalidInput");
    }
    return QStringLiteral("Unknown");
}
