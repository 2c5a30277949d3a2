#include "relay/Messages.h"

#include <cstdio>
#include <ctime>

namespace cloudbridge::relay {

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    const auto ms_total = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    auto secs = static_cast<std::time_t>(ms_total / 1000);
    auto ms = static_cast<int>(ms_total % 1000);
    if (ms < 0) {
        ms += 1000;
        --secs;
    }

    std::tm utc{};
    gmtime_r(&secs, &utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, ms);
    return buf;
}

std::string iso_timestamp_now() {
    return iso_timestamp(std::chrono::system_clock::now());
}

namespace messages {

json::object connected(Role role, const std::string& session_id) {
    return {
        {"type", "connected"},
        {"role", to_string(role)},
        {"sessionId", session_id},
        {"timestamp", iso_timestamp_now()}
    };
}

json::object guest_joined(const std::string& guest_id) {
    return {
        {"type", "guest_joined"},
        {"guestId", guest_id},
        {"timestamp", iso_timestamp_now()}
    };
}

json::object peer_left(Role departed) {
    return {
        {"type", departed == Role::Host ? "host_left" : "guest_left"},
        {"timestamp", iso_timestamp_now()}
    };
}

} // namespace messages

} // namespace cloudbridge::relay
