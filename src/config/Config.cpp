#include "config/Config.h"

#include <boost/program_options.hpp>

#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace cloudbridge::config {

namespace po = boost::program_options;

namespace {

const std::unordered_map<std::string, std::string>& environment_names() {
    static const std::unordered_map<std::string, std::string> names{
        {"PORT", "port"},
        {"GUEST_URL", "guest-url"},
        {"BRIDGE_ADDRESS", "address"},
        {"BRIDGE_THREADS", "threads"},
        {"BRIDGE_EMPTY_GRACE", "empty-grace"},
        {"BRIDGE_IDLE_TIMEOUT", "idle-timeout"},
        {"BRIDGE_SWEEP_INTERVAL", "sweep-interval"},
        {"BRIDGE_PING_INTERVAL", "ping-interval"},
        {"BRIDGE_MAX_MESSAGE_BYTES", "max-message-bytes"},
        {"BRIDGE_QUIET", "quiet"},
    };
    return names;
}

void require_positive(long value, const char* name) {
    if (value <= 0) throw std::invalid_argument(std::string(name) + " must be greater than zero");
}

} // namespace

networking::WebSocketServer::Options Config::server_options() const {
    networking::WebSocketServer::Options o;
    o.address = address;
    o.port = port;
    o.ping_interval = ping_interval;
    o.max_message_bytes = max_message_bytes;
    return o;
}

relay::SweepPolicy Config::sweep_policy() const {
    relay::SweepPolicy p;
    p.empty_grace = empty_grace;
    p.idle_timeout = idle_timeout;
    p.sweep_interval = sweep_interval;
    return p;
}

std::string option_for_environment(const std::string& variable) {
    const auto& names = environment_names();
    auto it = names.find(variable);
    return it == names.end() ? std::string{} : it->second;
}

Config parse(int argc, const char* const argv[], bool use_environment) {
    Config cfg;

    long port = cfg.port;
    long threads = cfg.threads;
    long empty_grace = cfg.empty_grace.count();
    long idle_timeout = cfg.idle_timeout.count();
    long sweep_interval = cfg.sweep_interval.count();
    long ping_interval = cfg.ping_interval.count();
    long max_message_bytes = static_cast<long>(cfg.max_message_bytes);

    po::options_description desc("cloudbridge options");
    desc.add_options()
        ("help,h", "show this help")
        ("address", po::value(&cfg.address)->default_value(cfg.address), "listen address")
        ("port,p", po::value(&port)->default_value(port), "listen port (HTTP and WebSocket)")
        ("guest-url", po::value(&cfg.guest_url)->default_value(cfg.guest_url), "base URL guests join from")
        ("threads", po::value(&threads)->default_value(threads), "I/O threads")
        ("empty-grace", po::value(&empty_grace)->default_value(empty_grace),
            "seconds an unbound session survives")
        ("idle-timeout", po::value(&idle_timeout)->default_value(idle_timeout),
            "seconds without activity before a session is evicted")
        ("sweep-interval", po::value(&sweep_interval)->default_value(sweep_interval),
            "seconds between idle sweeps")
        ("ping-interval", po::value(&ping_interval)->default_value(ping_interval),
            "seconds between WebSocket pings")
        ("max-message-bytes", po::value(&max_message_bytes)->default_value(max_message_bytes),
            "largest accepted WebSocket message")
        ("quiet", po::value(&cfg.quiet)->implicit_value(true)->default_value(false),
            "only log errors (true/false, yes/no, on/off, 1/0)");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (use_environment) {
        po::store(po::parse_environment(desc, option_for_environment), vm);
    }
    po::notify(vm);

    std::ostringstream usage;
    usage << desc;
    cfg.usage = usage.str();
    cfg.show_help = vm.count("help") != 0;

    if (port < 0 || port > 65535) throw std::invalid_argument("port must be between 0 and 65535");
    require_positive(threads, "threads");
    require_positive(empty_grace, "empty-grace");
    require_positive(idle_timeout, "idle-timeout");
    require_positive(sweep_interval, "sweep-interval");
    require_positive(ping_interval, "ping-interval");
    require_positive(max_message_bytes, "max-message-bytes");

    while (!cfg.guest_url.empty() && cfg.guest_url.back() == '/') cfg.guest_url.pop_back();
    if (cfg.guest_url.empty()) throw std::invalid_argument("guest-url must not be empty");

    cfg.port = static_cast<unsigned short>(port);
    cfg.threads = static_cast<unsigned>(threads);
    cfg.empty_grace = std::chrono::seconds(empty_grace);
    cfg.idle_timeout = std::chrono::seconds(idle_timeout);
    cfg.sweep_interval = std::chrono::seconds(sweep_interval);
    cfg.ping_interval = std::chrono::seconds(ping_interval);
    cfg.max_message_bytes = static_cast<std::size_t>(max_message_bytes);

    return cfg;
}

} // namespace cloudbridge::config
