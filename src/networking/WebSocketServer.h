#pragma once

#include "networking/QueryString.h"
#include "networking/Transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cloudbridge::networking {

using ClientId = std::uint64_t;

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// One listener for both plain HTTP requests and WebSocket upgrades. Upgrades
// are accepted on any path; the query string is handed to on_connect.
class WebSocketServer {
public:
    struct Options {
        std::string address = "0.0.0.0";
        unsigned short port = 3000;  // 0 picks an ephemeral port
        std::chrono::steady_clock::duration ping_interval = std::chrono::seconds(30);
        std::size_t max_message_bytes = 1024 * 1024;
    };

    using OnConnect    = std::function<void(const TransportPtr&, const QueryParams&)>;
    using OnDisconnect = std::function<void(const TransportPtr&)>;
    using OnMessage    = std::function<void(const TransportPtr&, const std::string&)>;
    using OnPong       = std::function<void(const TransportPtr&)>;
    using HttpHandler  = std::function<HttpResponse(const HttpRequest&)>;

    // Binds and listens immediately; throws boost::system::system_error if
    // the endpoint is unavailable.
    WebSocketServer(boost::asio::io_context& ioc, Options options);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);
    void set_on_pong(OnPong cb);
    void set_http_handler(HttpHandler handler);

    void start();  // start accepting
    void stop();   // stop accepting + close live connections (1001)

    unsigned short port() const;
    std::size_t connection_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cloudbridge::networking
