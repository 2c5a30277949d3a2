#pragma once

#include "relay/Session.hpp"
#include "relay/SessionRegistry.h"

#include <string>
#include <string_view>

namespace cloudbridge::relay {

enum class ForwardResult {
    Delivered,
    PeerUnavailable,  // dropped, nobody to hand it to
    Malformed,        // not a JSON object, discarded
    SessionGone,
};

// Forwards opaque JSON objects between the two roles of a session. Delivery is
// best-effort and at-most-once: nothing is queued for an absent peer.
class RelayEngine {
public:
    explicit RelayEngine(SessionRegistry& registry);

    ForwardResult forward(const std::string& session_id, Role sender, std::string_view raw);

private:
    SessionRegistry& registry_;
};

} // namespace cloudbridge::relay
