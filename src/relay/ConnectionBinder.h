#pragma once

#include "networking/Transport.hpp"
#include "relay/IDGenerator.hpp"
#include "relay/Session.hpp"
#include "relay/SessionRegistry.h"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace cloudbridge::relay {

// Raw handshake parameters as they arrived on the upgrade request.
struct ConnectRequest {
    std::string session_id;
    std::string role;
    std::string secret;  // host only
};

// Where an attached transport lives.
struct Attachment {
    std::string session_id;
    Role role = Role::Host;
};

enum class BindResult {
    Bound,
    MissingParameters,
    InvalidRole,
    UnknownSession,
    InvalidSecret,
};

const char* to_string(BindResult result) noexcept;

// Attaches transports to session roles and detaches them on close. Rejected
// transports are closed with a policy-violation status. A transport that
// replaces a live binding for the same role closes the superseded one; the
// superseded transport's own close is then a no-op.
class ConnectionBinder {
public:
    using OnSessionEmpty = std::function<void(const std::string& session_id)>;

    ConnectionBinder(SessionRegistry& registry, IDGenerator& idgen);

    ConnectionBinder(const ConnectionBinder&) = delete;
    ConnectionBinder& operator=(const ConnectionBinder&) = delete;

    // Called after a detach leaves both roles of a session unbound.
    void set_on_session_empty(OnSessionEmpty cb);

    BindResult attach(const networking::TransportPtr& transport, const ConnectRequest& req);

    // Transport went away. Unknown or superseded transports are ignored.
    void detach(const networking::TransportPtr& transport);

    // Liveness probe answered: refreshes the session's activity stamp.
    bool touch(const networking::TransportPtr& transport);

    std::optional<Attachment> attachment_of(const networking::TransportPtr& transport) const;
    std::size_t attached_count() const;

private:
    void reject(const networking::TransportPtr& transport, BindResult why, const std::string& detail);

    SessionRegistry& registry_;
    IDGenerator& idgen_;
    OnSessionEmpty on_session_empty_;

    mutable std::mutex mu_;
    std::unordered_map<const networking::Transport*, Attachment> attachments_;
};

} // namespace cloudbridge::relay
