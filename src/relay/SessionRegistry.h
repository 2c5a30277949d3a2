#pragma once

#include "relay/IDGenerator.hpp"
#include "relay/Session.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudbridge::relay {

// In-memory id -> Session map. A single mutex serializes every membership
// change and every mutation of a session's fields. Callbacks passed to
// update() run under that mutex and must not perform I/O; collect the
// transports you need and write to them after update() returns.
class SessionRegistry {
public:
    using Clock    = Session::Clock;
    using Mutator  = std::function<void(Session&)>;

    explicit SessionRegistry(IDGenerator& idgen);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Inserts a session under a fresh id and returns a copy of it, secret
    // included. This is the only place the secret is handed out.
    Session create();

    // Passive lookup; leaves last_activity untouched.
    std::optional<Session> get(const std::string& id) const;

    // Idempotent. Returns whether a session was removed.
    bool erase(const std::string& id);

    // Number of live sessions.
    std::size_t size() const;

    // Runs fn on the session under the registry lock. Returns false when the
    // id is unknown (fn is not called).
    bool update(const std::string& id, const Mutator& fn);

    // Removes the session only if neither role is bound.
    bool erase_if_unbound(const std::string& id);

    // Removes every session idle for longer than timeout at `now` and returns
    // the removed sessions so the caller can close their transports.
    std::vector<Session> evict_idle(Clock::time_point now, Clock::duration timeout);

private:
    IDGenerator& idgen_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Session> sessions_;
};

} // namespace cloudbridge::relay
