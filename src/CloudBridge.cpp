#include "Bridge.h"
#include "config/Config.h"
#include "core/Log.hpp"
#include "core/ScheduledTask.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/program_options/errors.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

// How long in-flight work may drain after a shutdown signal.
constexpr auto kShutdownDeadline = std::chrono::seconds(5);
constexpr auto kDrainPoll = std::chrono::milliseconds(100);

} // namespace

int main(int argc, char* argv[]) {
    using namespace cloudbridge;

    config::Config cfg;
    try {
        cfg = config::parse(argc, argv);
    } catch (const boost::program_options::error& e) {
        std::cerr << "cloudbridge: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "cloudbridge: " << e.what() << "\n";
        return 1;
    }

    if (cfg.show_help) {
        std::cout << cfg.usage;
        return 0;
    }
    log::set_quiet(cfg.quiet);

    boost::asio::io_context ioc(static_cast<int>(cfg.threads));

    std::unique_ptr<Bridge> bridge;
    try {
        bridge = std::make_unique<Bridge>(ioc, cfg);
    } catch (const std::exception& e) {
        log::error("CloudBridge", "cannot listen on ", cfg.address, ":", cfg.port, ": ", e.what());
        return 1;
    }
    bridge->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::steady_timer deadline(ioc);
    core::ScheduledTaskPtr drain;
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        log::info("CloudBridge", "signal ", sig, " received, closing server...");
        bridge->stop();

        deadline.expires_after(kShutdownDeadline);
        deadline.async_wait([&](const boost::system::error_code& wait_ec) {
            if (wait_ec) return;
            log::error("CloudBridge", "connections did not drain in time, forcing exit");
            ioc.stop();
        });

        drain = core::ScheduledTask::every(ioc.get_executor(), kDrainPoll, [&] {
            if (bridge->connection_count() != 0) return;
            drain->cancel();
            deadline.cancel();
        });
        drain->start();
    });

    log::info("CloudBridge", "bridge server running on port ", bridge->port());
    log::info("CloudBridge", "WebSocket endpoint: ws://localhost:", bridge->port());
    log::info("CloudBridge", "guest URL: ", cfg.guest_url);

    std::vector<std::thread> workers;
    for (unsigned i = 1; i < cfg.threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    log::info("CloudBridge", "server closed");
    return 0;
}
