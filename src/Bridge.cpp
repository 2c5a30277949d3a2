#include "Bridge.h"

#include "core/Log.hpp"

#include <boost/asio/strand.hpp>

namespace cloudbridge {

using networking::QueryParams;
using networking::TransportPtr;

namespace {

std::string param(const QueryParams& params, const char* key) {
    auto it = params.find(key);
    return it == params.end() ? std::string{} : it->second;
}

} // namespace

Bridge::Bridge(boost::asio::io_context& ioc, const config::Config& cfg)
    : registry_(idgen_),
      binder_(registry_, idgen_),
      relay_(registry_),
      sweeper_(boost::asio::make_strand(ioc), registry_, cfg.sweep_policy()),
      api_(registry_, cfg.guest_url),
      server_(ioc, cfg.server_options()) {

    binder_.set_on_session_empty([this](const std::string& session_id) {
        sweeper_.schedule_reap(session_id);
    });

    server_.set_http_handler([this](const networking::HttpRequest& req) {
        return api_.handle(req);
    });

    server_.set_on_connect([this](const TransportPtr& t, const QueryParams& params) {
        relay::ConnectRequest req;
        req.session_id = param(params, "sessionId");
        req.role = param(params, "role");
        req.secret = param(params, "secret");
        if (req.secret.empty()) req.secret = param(params, "clientId");

        log::info("CloudBridge", "WebSocket connection: ", req.role, " for session ", req.session_id);
        binder_.attach(t, req);
    });

    server_.set_on_message([this](const TransportPtr& t, const std::string& msg) {
        if (auto at = binder_.attachment_of(t)) relay_.forward(at->session_id, at->role, msg);
    });

    server_.set_on_pong([this](const TransportPtr& t) { binder_.touch(t); });

    server_.set_on_disconnect([this](const TransportPtr& t) { binder_.detach(t); });
}

void Bridge::start() {
    sweeper_.start();
    server_.start();
}

void Bridge::stop() {
    server_.stop();
    sweeper_.stop();
}

} // namespace cloudbridge
