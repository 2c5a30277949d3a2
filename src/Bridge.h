#pragma once

#include "api/SessionApi.h"
#include "config/Config.h"
#include "networking/WebSocketServer.h"
#include "relay/ConnectionBinder.h"
#include "relay/IDGenerator.hpp"
#include "relay/LifecycleSweeper.h"
#include "relay/RelayEngine.h"
#include "relay/SessionRegistry.h"

#include <boost/asio/io_context.hpp>

#include <cstddef>

namespace cloudbridge {

// Owns the registry and the components around it, and wires them to the
// network listener.
class Bridge {
public:
    Bridge(boost::asio::io_context& ioc, const config::Config& cfg);

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    void start();

    // Stops accepting, closes live connections and cancels sweeper timers.
    void stop();

    unsigned short port() const { return server_.port(); }
    std::size_t connection_count() const { return server_.connection_count(); }

    relay::SessionRegistry& registry() noexcept { return registry_; }
    relay::ConnectionBinder& binder() noexcept { return binder_; }
    relay::LifecycleSweeper& sweeper() noexcept { return sweeper_; }

private:
    relay::IDGenerator idgen_;
    relay::SessionRegistry registry_;
    relay::ConnectionBinder binder_;
    relay::RelayEngine relay_;
    relay::LifecycleSweeper sweeper_;
    api::SessionApi api_;
    networking::WebSocketServer server_;
};

} // namespace cloudbridge
