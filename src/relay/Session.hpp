#pragma once

#include "networking/Transport.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cloudbridge::relay {

enum class Role { Host, Guest };

inline constexpr const char* to_string(Role role) noexcept {
    return role == Role::Host ? "host" : "guest";
}

inline constexpr Role peer_of(Role role) noexcept {
    return role == Role::Host ? Role::Guest : Role::Host;
}

inline std::optional<Role> parse_role(std::string_view s) noexcept {
    if (s == "host") return Role::Host;
    if (s == "guest") return Role::Guest;
    return std::nullopt;
}

struct Unbound {};

struct BoundTo {
    networking::TransportPtr transport;
};

// A role slot holds at most one transport.
using Binding = std::variant<Unbound, BoundTo>;

struct Session {
    using Clock     = std::chrono::steady_clock;
    using WallClock = std::chrono::system_clock;

    std::string id;
    std::string host_secret;
    std::optional<std::string> guest_id;

    Binding host  = Unbound{};
    Binding guest = Unbound{};

    WallClock::time_point created_at{};
    Clock::time_point last_activity{};

    void touch(Clock::time_point now = Clock::now()) noexcept { last_activity = now; }

    Binding& binding(Role role) noexcept { return role == Role::Host ? host : guest; }
    const Binding& binding(Role role) const noexcept { return role == Role::Host ? host : guest; }

    // Bound transport for the role, or nullptr.
    networking::TransportPtr transport(Role role) const {
        if (const auto* b = std::get_if<BoundTo>(&binding(role))) return b->transport;
        return nullptr;
    }

    bool is_bound(Role role) const noexcept {
        return std::holds_alternative<BoundTo>(binding(role));
    }

    // Bound and still open.
    bool is_live(Role role) const {
        const auto t = transport(role);
        return t && t->is_open();
    }

    bool unbound() const noexcept { return !is_bound(Role::Host) && !is_bound(Role::Guest); }
};

} // namespace cloudbridge::relay
