#include "networking/WebSocketServer.h"

#include "core/Log.hpp"
#include "core/ScheduledTask.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cloudbridge::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kHttpReadTimeout = std::chrono::seconds(30);
constexpr std::size_t kHttpBodyLimit = 64 * 1024;
constexpr const char* kServerName = "cloudbridge";

} // namespace

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, Options options)
        : ioc_(ioc),
          options_(std::move(options)),
          acceptor_(ioc) {
        const tcp::endpoint endpoint(asio::ip::make_address(options_.address), options_.port);

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(asio::socket_base::max_listen_connections);
    }

    void start() { do_accept(); }

    void stop() {
        asio::post(acceptor_.get_executor(), [this] {
            beast::error_code ec;
            acceptor_.close(ec);
        });

        // Entries leave the map as each connection finishes closing.
        std::vector<std::shared_ptr<Connection>> live;
        {
            std::lock_guard<std::mutex> lk(mu_);
            for (auto& [id, weak] : connections_) {
                if (auto c = weak.lock()) live.push_back(std::move(c));
            }
        }
        for (auto& c : live) c->shutdown();
    }

    unsigned short port() const {
        beast::error_code ec;
        const auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.size();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }
    void set_on_pong(OnPong cb) { on_pong_ = std::move(cb); }
    void set_http_handler(HttpHandler handler) { http_handler_ = std::move(handler); }

private:
    // Anything the server must be able to tear down on stop().
    class Connection {
    public:
        virtual ~Connection() = default;
        virtual void shutdown() = 0;
    };

    class WsSession : public Transport,
                      public Connection,
                      public std::enable_shared_from_this<WsSession> {
    public:
        WsSession(Impl& server, tcp::socket&& socket, ClientId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)) {}

        void run(HttpRequest req) {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
                res.set(http::field::server, kServerName);
            }));
            ws_.read_message_max(server_.options_.max_message_bytes);

            // Invoked from inside our own read operation, which keeps us alive.
            ws_.control_callback([this](websocket::frame_type kind, beast::string_view) {
                if (kind == websocket::frame_type::pong && server_.on_pong_) {
                    server_.on_pong_(shared_from_this());
                }
            });

            req_ = std::move(req);
            params_ = parse_query(std::string_view(req_.target().data(), req_.target().size()));

            ws_.async_accept(
                req_,
                [self = shared_from_this()](beast::error_code ec) {
                    if (ec) return self->fail("accept", ec);
                    self->on_accept();
                });
        }

        // ---- Transport ----

        void send(std::string msg) override {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this(), msg = std::move(msg)]() mutable {
                    if (!self->open_ || self->closing_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(std::move(msg));
                    if (!writing) self->do_write();
                });
        }

        void close(CloseCode code, std::string reason) override {
            asio::post(
                ws_.get_executor(),
                [self = shared_from_this(), code, reason = std::move(reason)] {
                    self->do_close(code, reason);
                });
        }

        bool is_open() const noexcept override { return open_ && !closing_; }

        std::string label() const override { return "#" + std::to_string(id_); }

        // ---- Connection ----

        void shutdown() override { close(CloseCode::GoingAway, "Server shutting down"); }

    private:
        void on_accept() {
            open_ = true;
            server_.track(id_, shared_from_this());

            if (server_.on_connect_) server_.on_connect_(shared_from_this(), params_);

            probe_ = core::ScheduledTask::every(
                ws_.get_executor(),
                server_.options_.ping_interval,
                [weak = weak_from_this()] {
                    if (auto self = weak.lock()) self->do_ping();
                });
            probe_->start();

            do_read();
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) return self->on_close_or_fail(ec);

                    std::string msg = beast::buffers_to_string(self->buffer_.data());
                    self->buffer_.consume(self->buffer_.size());

                    if (self->server_.on_message_) self->server_.on_message_(self, msg);

                    self->do_read();
                });
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(write_queue_.front()),
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    if (ec) {
                        self->write_queue_.clear();
                        if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                            self->fail("write", ec);
                        }
                        return;
                    }

                    self->write_queue_.pop_front();
                    if (!self->write_queue_.empty()) self->do_write();
                });
        }

        void do_ping() {
            if (!open_ || closing_ || ping_pending_) return;

            ping_pending_ = true;
            ws_.async_ping(
                {},
                [self = shared_from_this()](beast::error_code ec) {
                    self->ping_pending_ = false;
                    if (ec && ec != asio::error::operation_aborted && ec != websocket::error::closed) {
                        self->fail("ping", ec);
                    }
                });
        }

        void do_close(CloseCode code, const std::string& reason) {
            if (!open_ || closing_) return;
            closing_ = true;
            stop_probe();

            ws_.async_close(
                websocket::close_reason(static_cast<websocket::close_code>(code), reason),
                [self = shared_from_this()](beast::error_code ec) {
                    if (ec && ec != asio::error::operation_aborted) self->fail("close", ec);
                });
        }

        void on_close_or_fail(beast::error_code ec) {
            // WebSocket close is common; treat it as disconnect.
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                fail("read", ec);
            }
            disconnect();
        }

        void disconnect() {
            if (disconnected_) return;
            disconnected_ = true;
            open_ = false;
            stop_probe();

            server_.untrack(id_);
            if (server_.on_disconnect_) server_.on_disconnect_(shared_from_this());
        }

        void stop_probe() {
            if (probe_) {
                probe_->cancel();
                probe_.reset();
            }
        }

        void fail(const char* what, beast::error_code ec) {
            log::error("Connection #" + std::to_string(id_), what, ": ", ec.message());
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        HttpRequest req_;
        QueryParams params_;

        beast::flat_buffer buffer_;
        std::deque<std::string> write_queue_;
        core::ScheduledTaskPtr probe_;

        std::atomic<bool> open_{false};
        std::atomic<bool> closing_{false};
        bool ping_pending_ = false;
        bool disconnected_ = false;
    };

    class HttpSession : public Connection,
                        public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(Impl& server, tcp::socket&& socket, ClientId id)
            : server_(server),
              id_(id),
              stream_(std::move(socket)) {}

        void run() {
            server_.track(id_, shared_from_this());
            asio::dispatch(stream_.get_executor(), [self = shared_from_this()] { self->do_read(); });
        }

        void shutdown() override {
            asio::post(stream_.get_executor(), [self = shared_from_this()] {
                beast::error_code ec;
                self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
                self->stream_.close();
            });
        }

    private:
        void do_read() {
            parser_.emplace();
            parser_->body_limit(kHttpBodyLimit);
            stream_.expires_after(kHttpReadTimeout);

            http::async_read(
                stream_, buffer_, *parser_,
                [self = shared_from_this()](beast::error_code ec, std::size_t) {
                    self->on_read(ec);
                });
        }

        void on_read(beast::error_code ec) {
            if (ec == http::error::end_of_stream) return do_close();
            if (ec) {
                if (ec != beast::error::timeout && ec != asio::error::operation_aborted) {
                    log::error("http #" + std::to_string(id_), "read: ", ec.message());
                }
                return finish();
            }

            if (websocket::is_upgrade(parser_->get())) {
                stream_.expires_never();
                auto ws = std::make_shared<WsSession>(server_, stream_.release_socket(), server_.next_id());
                ws->run(parser_->release());
                return finish();
            }

            auto res = std::make_shared<HttpResponse>(server_.handle_http(parser_->get()));
            res->set(http::field::server, kServerName);
            res->keep_alive(parser_->get().keep_alive());
            res->prepare_payload();
            if (parser_->get().method() == http::verb::head) res->body().clear();

            http::async_write(
                stream_, *res,
                [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                    if (ec) {
                        log::error("http #" + std::to_string(self->id_), "write: ", ec.message());
                        return self->finish();
                    }
                    if (!res->keep_alive()) return self->do_close();
                    self->do_read();
                });
        }

        void do_close() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            finish();
        }

        void finish() { server_.untrack(id_); }

        Impl& server_;
        ClientId id_;

        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
    };

    void do_accept() {
        // Each connection gets its own strand.
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted || !acceptor_.is_open()) return;
                    log::error("accept", ec.message());
                    return do_accept();
                }

                std::make_shared<HttpSession>(*this, std::move(socket), next_id())->run();
                do_accept();
            });
    }

    HttpResponse handle_http(const HttpRequest& req) {
        if (http_handler_) return http_handler_(req);

        HttpResponse res{http::status::not_found, req.version()};
        res.set(http::field::content_type, "text/plain");
        res.body() = "Not found";
        return res;
    }

    ClientId next_id() { return next_client_id_++; }

    void track(ClientId id, const std::shared_ptr<Connection>& c) {
        std::lock_guard<std::mutex> lk(mu_);
        connections_[id] = c;
    }

    void untrack(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        connections_.erase(id);
    }

private:
    asio::io_context& ioc_;
    Options options_;
    tcp::acceptor acceptor_;

    std::atomic<ClientId> next_client_id_{1};

    mutable std::mutex mu_;
    std::unordered_map<ClientId, std::weak_ptr<Connection>> connections_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
    OnPong on_pong_;
    HttpHandler http_handler_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, Options options)
    : impl_(new Impl(ioc, std::move(options))) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }
void WebSocketServer::set_on_pong(OnPong cb) { impl_->set_on_pong(std::move(cb)); }
void WebSocketServer::set_http_handler(HttpHandler handler) { impl_->set_http_handler(std::move(handler)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }
std::size_t WebSocketServer::connection_count() const { return impl_->connection_count(); }

WebSocketServer::~WebSocketServer() = default;

} // namespace cloudbridge::networking
