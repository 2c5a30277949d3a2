#pragma once

#include "relay/Session.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <string>

namespace cloudbridge::relay {

namespace json = boost::json;

// ISO-8601 UTC with millisecond precision, e.g. "2026-01-01T12:00:00.000Z".
std::string iso_timestamp(std::chrono::system_clock::time_point tp);
std::string iso_timestamp_now();

inline std::string dump(const json::object& obj) {
    return json::serialize(obj);
}

// Control events generated by the bridge itself.
namespace messages {

json::object connected(Role role, const std::string& session_id);
json::object guest_joined(const std::string& guest_id);

// "host_left" or "guest_left" depending on who went away.
json::object peer_left(Role departed);

} // namespace messages

} // namespace cloudbridge::relay
