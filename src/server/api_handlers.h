#pragma once
#include "http_message.h"
#include "request_router.h"

class Relay;
class StatusCheck;
class StaticFiles;

// Turns routed requests into responses. Safe to call from several worker
// threads at once: it holds only references to components without mutable
// shared state.
class ApiHandlers {
public:
    ApiHandlers(Relay& relay, StatusCheck& statusCheck, const StaticFiles& staticFiles);

    HttpResponse dispatch(Endpoint endpoint, const HttpRequest& request);

    HttpResponse health() const;
    HttpResponse generate(const HttpRequest& request);
    HttpResponse upstreamStatus();
    HttpResponse index() const;
    HttpResponse staticAsset(const QString& path) const;

private:
    Relay& m_relay;
    StatusCheck& m_statusCheck;
    const StaticFiles& m_staticFiles;
};
