#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace cloudbridge::networking {

// Subset of RFC 6455 close codes the bridge emits.
enum class CloseCode : std::uint16_t {
    Normal          = 1000,
    GoingAway       = 1001,
    PolicyViolation = 1008,
};

// One live duplex connection. Implementations must be safe to call from any
// thread; send() and close() only enqueue work and never block on the peer.
class Transport {
public:
    virtual ~Transport() = default;

    virtual void send(std::string msg) = 0;
    virtual void close(CloseCode code, std::string reason) = 0;
    virtual bool is_open() const noexcept = 0;

    // Short label for log lines ("#12").
    virtual std::string label() const = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace cloudbridge::networking
