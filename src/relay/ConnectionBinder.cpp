#include "relay/ConnectionBinder.h"

#include "core/Log.hpp"
#include "relay/Messages.h"

#include <utility>

namespace cloudbridge::relay {

using networking::CloseCode;
using networking::TransportPtr;

const char* to_string(BindResult result) noexcept {
    switch (result) {
        case BindResult::Bound:             return "bound";
        case BindResult::MissingParameters: return "Missing sessionId or role";
        case BindResult::InvalidRole:       return "Invalid role";
        case BindResult::UnknownSession:    return "Session not found";
        case BindResult::InvalidSecret:     return "Invalid host secret";
    }
    return "rejected";
}

ConnectionBinder::ConnectionBinder(SessionRegistry& registry, IDGenerator& idgen)
    : registry_(registry),
      idgen_(idgen) {}

void ConnectionBinder::set_on_session_empty(OnSessionEmpty cb) { on_session_empty_ = std::move(cb); }

BindResult ConnectionBinder::attach(const TransportPtr& transport, const ConnectRequest& req) {
    if (req.session_id.empty() || req.role.empty()) {
        reject(transport, BindResult::MissingParameters, "");
        return BindResult::MissingParameters;
    }

    const auto role = parse_role(req.role);
    if (!role) {
        reject(transport, BindResult::InvalidRole, req.role);
        return BindResult::InvalidRole;
    }

    const std::string session_id = IDGenerator::normalize(req.session_id);

    bool secret_ok = true;
    TransportPtr superseded;
    TransportPtr host_to_notify;
    std::string guest_id;

    const bool found = registry_.update(session_id, [&](Session& s) {
        if (*role == Role::Host && req.secret != s.host_secret) {
            secret_ok = false;
            return;
        }

        if (*role == Role::Guest) {
            if (!s.guest_id) s.guest_id = idgen_.guest_id();
            guest_id = *s.guest_id;
            if (s.is_live(Role::Host)) host_to_notify = s.transport(Role::Host);
        }

        superseded = s.transport(*role);
        s.binding(*role) = BoundTo{transport};
        s.touch();

        // Registry lock is held: the map always agrees with the bindings.
        std::lock_guard<std::mutex> lk(mu_);
        if (superseded) attachments_.erase(superseded.get());
        attachments_[transport.get()] = Attachment{session_id, *role};
    });

    if (!found) {
        reject(transport, BindResult::UnknownSession, session_id);
        return BindResult::UnknownSession;
    }
    if (!secret_ok) {
        reject(transport, BindResult::InvalidSecret, session_id);
        return BindResult::InvalidSecret;
    }

    if (superseded && superseded != transport) {
        log::info("Session " + session_id, to_string(*role), " ", superseded->label(),
                  " replaced by ", transport->label());
        superseded->close(CloseCode::GoingAway, "Replaced by a newer connection");
    }

    log::info("Session " + session_id, to_string(*role), " connected (", transport->label(), ")");

    if (host_to_notify) host_to_notify->send(dump(messages::guest_joined(guest_id)));
    transport->send(dump(messages::connected(*role, session_id)));

    return BindResult::Bound;
}

void ConnectionBinder::detach(const TransportPtr& transport) {
    Attachment at;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = attachments_.find(transport.get());
        if (it == attachments_.end()) return;
        at = std::move(it->second);
        attachments_.erase(it);
    }

    bool detached = false;
    bool now_empty = false;
    TransportPtr peer;

    registry_.update(at.session_id, [&](Session& s) {
        if (s.transport(at.role) != transport) return;

        s.binding(at.role) = Unbound{};
        s.touch();
        detached = true;
        now_empty = s.unbound();
        if (s.is_live(peer_of(at.role))) peer = s.transport(peer_of(at.role));
    });

    if (!detached) return;

    log::info("Session " + at.session_id, to_string(at.role), " disconnected (", transport->label(), ")");

    if (peer) peer->send(dump(messages::peer_left(at.role)));
    if (now_empty && on_session_empty_) on_session_empty_(at.session_id);
}

bool ConnectionBinder::touch(const TransportPtr& transport) {
    const auto at = attachment_of(transport);
    if (!at) return false;

    bool touched = false;
    registry_.update(at->session_id, [&](Session& s) {
        if (s.transport(at->role) != transport) return;
        s.touch();
        touched = true;
    });
    return touched;
}

std::optional<Attachment> ConnectionBinder::attachment_of(const TransportPtr& transport) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = attachments_.find(transport.get());
    if (it == attachments_.end()) return std::nullopt;
    return it->second;
}

std::size_t ConnectionBinder::attached_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return attachments_.size();
}

void ConnectionBinder::reject(const TransportPtr& transport, BindResult why, const std::string& detail) {
    log::error("Binder", "rejecting ", transport->label(), ": ", to_string(why),
               detail.empty() ? "" : " (", detail, detail.empty() ? "" : ")");
    transport->close(CloseCode::PolicyViolation, to_string(why));
}

} // namespace cloudbridge::relay
