#pragma once

#include "networking/WebSocketServer.h"
#include "relay/SessionRegistry.h"

#include <boost/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace cloudbridge::api {

namespace json = boost::json;

// Request/response surface over the session registry:
//   POST /api/session/create   -> {sessionId, hostSecret, hostId, guestUrl}
//   GET  /api/session/{id}     -> {sessionId, hasHost, hasGuest, createdAt} | 404
//   GET  /health               -> {status, activeSessions, uptime}
// Every response allows any origin; OPTIONS is answered as a CORS preflight.
class SessionApi {
public:
    using Clock = std::chrono::steady_clock;

    SessionApi(relay::SessionRegistry& registry,
               std::string guest_base_url,
               Clock::time_point started_at = Clock::now());

    networking::HttpResponse handle(const networking::HttpRequest& req);

    json::object create_session();
    std::optional<json::object> session_info(const std::string& session_id) const;
    json::object health() const;

private:
    relay::SessionRegistry& registry_;
    std::string guest_base_url_;
    Clock::time_point started_at_;
};

} // namespace cloudbridge::api
