#pragma once

#include "networking/WebSocketServer.h"
#include "relay/LifecycleSweeper.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace cloudbridge::config {

struct Config {
    std::string address = "0.0.0.0";
    unsigned short port = 3000;
    std::string guest_url = "http://localhost:3001";
    unsigned threads = 1;

    std::chrono::seconds empty_grace{300};
    std::chrono::seconds idle_timeout{1800};
    std::chrono::seconds sweep_interval{600};
    std::chrono::seconds ping_interval{30};
    std::size_t max_message_bytes = 1024 * 1024;

    bool quiet = false;

    bool show_help = false;
    std::string usage;

    networking::WebSocketServer::Options server_options() const;
    relay::SweepPolicy sweep_policy() const;
};

// Reads options from argv and, when use_environment is set, from the process
// environment (command line wins). Throws boost::program_options::error on
// unknown options or bad values and std::invalid_argument when a value is out
// of range.
Config parse(int argc, const char* const argv[], bool use_environment = true);

// Maps an environment variable to its option name, or "" when the variable
// is not one of ours.
std::string option_for_environment(const std::string& variable);

} // namespace cloudbridge::config
