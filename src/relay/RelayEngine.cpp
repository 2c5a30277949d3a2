#include "relay/RelayEngine.h"

#include "core/Log.hpp"
#include "relay/Messages.h"

namespace cloudbridge::relay {

RelayEngine::RelayEngine(SessionRegistry& registry)
    : registry_(registry) {}

ForwardResult RelayEngine::forward(const std::string& session_id, Role sender, std::string_view raw) {
    json::error_code ec;
    json::value v = json::parse(json::string_view(raw.data(), raw.size()), ec);
    if (ec) {
        log::error("Relay", "dropping unparsable message from ", to_string(sender),
                   " in ", session_id, ": ", ec.message());
        return ForwardResult::Malformed;
    }

    auto* obj = v.if_object();
    if (!obj) {
        log::error("Relay", "dropping non-object message from ", to_string(sender), " in ", session_id);
        return ForwardResult::Malformed;
    }

    networking::TransportPtr target;
    const bool found = registry_.update(session_id, [&](Session& s) {
        s.touch();
        if (s.is_live(peer_of(sender))) target = s.transport(peer_of(sender));
    });
    if (!found) return ForwardResult::SessionGone;

    std::string type = "?";
    if (const auto* t = obj->if_contains("type"); t && t->is_string()) {
        type = std::string(t->get_string().c_str());
    }
    log::info("Relay", "message from ", to_string(sender), ": ", type);

    if (!target) {
        log::info("Relay", "target not connected for session ", session_id);
        return ForwardResult::PeerUnavailable;
    }

    (*obj)["sender"] = to_string(sender);
    (*obj)["timestamp"] = iso_timestamp_now();
    target->send(dump(*obj));
    return ForwardResult::Delivered;
}

} // namespace cloudbridge::relay
