#include "api/SessionApi.h"

#include "core/Log.hpp"
#include "networking/QueryString.h"
#include "relay/IDGenerator.hpp"
#include "relay/Messages.h"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include <string_view>
#include <utility>

namespace cloudbridge::api {

namespace http = boost::beast::http;

using networking::HttpRequest;
using networking::HttpResponse;

namespace {

constexpr std::string_view kSessionPrefix = "/api/session/";
constexpr const char* kAllowedMethods = "GET,HEAD,PUT,PATCH,POST,DELETE";

HttpResponse make_response(const HttpRequest& req, http::status status) {
    HttpResponse res{status, req.version()};
    res.set(http::field::access_control_allow_origin, "*");
    return res;
}

HttpResponse json_response(const HttpRequest& req, http::status status, const json::object& body) {
    auto res = make_response(req, status);
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.body() = json::serialize(body);
    return res;
}

HttpResponse preflight(const HttpRequest& req) {
    auto res = make_response(req, http::status::no_content);
    res.set(http::field::access_control_allow_methods, kAllowedMethods);

    auto requested = req.find(http::field::access_control_request_headers);
    if (requested != req.end()) {
        res.set(http::field::access_control_allow_headers, requested->value());
        res.set(http::field::vary, "Access-Control-Request-Headers");
    }
    return res;
}

} // namespace

SessionApi::SessionApi(relay::SessionRegistry& registry, std::string guest_base_url, Clock::time_point started_at)
    : registry_(registry),
      guest_base_url_(std::move(guest_base_url)),
      started_at_(started_at) {}

HttpResponse SessionApi::handle(const HttpRequest& req) {
    const std::string_view target(req.target().data(), req.target().size());
    const std::string_view path = networking::target_path(target);

    if (req.method() == http::verb::options) return preflight(req);

    // HEAD is answered like GET; the listener drops the body.
    const bool is_get = req.method() == http::verb::get || req.method() == http::verb::head;

    if (req.method() == http::verb::post && path == "/api/session/create") {
        return json_response(req, http::status::ok, create_session());
    }

    if (is_get && path.substr(0, kSessionPrefix.size()) == kSessionPrefix) {
        const std::string_view raw_id = path.substr(kSessionPrefix.size());
        if (!raw_id.empty() && raw_id.find('/') == std::string_view::npos) {
            if (auto info = session_info(networking::url_decode(raw_id))) {
                return json_response(req, http::status::ok, *info);
            }
            return json_response(req, http::status::not_found, {{"error", "Session not found"}});
        }
    }

    if (is_get && path == "/health") {
        return json_response(req, http::status::ok, health());
    }

    return json_response(req, http::status::not_found, {{"error", "Not found"}});
}

json::object SessionApi::create_session() {
    const relay::Session s = registry_.create();
    log::info("CloudBridge", "session created: ", s.id);

    return {
        {"sessionId", s.id},
        {"hostSecret", s.host_secret},
        {"hostId", s.host_secret},
        {"guestUrl", guest_base_url_ + "/join/" + s.id}
    };
}

std::optional<json::object> SessionApi::session_info(const std::string& session_id) const {
    const auto s = registry_.get(relay::IDGenerator::normalize(session_id));
    if (!s) return std::nullopt;

    return json::object{
        {"sessionId", s->id},
        {"hasHost", s->is_bound(relay::Role::Host)},
        {"hasGuest", s->is_bound(relay::Role::Guest)},
        {"createdAt", relay::iso_timestamp(s->created_at)}
    };
}

json::object SessionApi::health() const {
    const std::chrono::duration<double> uptime = Clock::now() - started_at_;

    return {
        {"status", "ok"},
        {"activeSessions", registry_.size()},
        {"uptime", uptime.count()}
    };
}

} // namespace cloudbridge::api
