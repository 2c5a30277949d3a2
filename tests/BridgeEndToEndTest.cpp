#include "Bridge.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace cloudbridge;
using namespace std::chrono_literals;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace json = boost::json;
using tcp = asio::ip::tcp;

namespace {

constexpr auto kIoTimeout = 5s;

// Minimal WebSocket peer. Every operation runs on the client's own
// io_context with a deadline so a broken server fails the test instead of
// hanging it.
struct WsClient {
    asio::io_context ioc;
    websocket::stream<tcp::socket> ws{ioc};
    beast::flat_buffer buffer;

    template <typename Start>
    beast::error_code await(Start&& start) {
        std::optional<beast::error_code> result;
        start([&result](beast::error_code ec, auto&&...) { result = ec; });

        ioc.restart();
        ioc.run_for(kIoTimeout);
        if (!result) {
            beast::error_code ignored;
            ws.next_layer().close(ignored);
            ioc.restart();
            ioc.run_for(kIoTimeout);
            return asio::error::timed_out;
        }
        return *result;
    }

    beast::error_code open(unsigned short port, const std::string& query) {
        const tcp::endpoint ep(asio::ip::make_address("127.0.0.1"), port);
        if (auto ec = await([&](auto h) { ws.next_layer().async_connect(ep, h); })) return ec;
        return await([&](auto h) { ws.async_handshake("127.0.0.1", "/?" + query, h); });
    }

    std::optional<json::object> read() {
        buffer.consume(buffer.size());
        if (await([&](auto h) { ws.async_read(buffer, h); })) return std::nullopt;
        return json::parse(beast::buffers_to_string(buffer.data())).as_object();
    }

    beast::error_code write(const std::string& text) {
        ws.text(true);
        return await([&](auto h) { ws.async_write(asio::buffer(text), h); });
    }

    beast::error_code close() {
        return await([&](auto h) { ws.async_close(websocket::close_code::normal, h); });
    }

    // Counts pings from the server. Beast answers them with pongs while a
    // read is pending.
    void count_pings() {
        ws.control_callback([this](websocket::frame_type kind, beast::string_view) {
            if (kind == websocket::frame_type::ping) ++pings;
        });
    }

    // Keeps one read pending and runs the client loop for `d`. Only valid
    // while no data frames are expected; the pending read stays outstanding
    // across calls.
    void listen_for(std::chrono::steady_clock::duration d) {
        if (!reading) {
            reading = true;
            buffer.consume(buffer.size());
            ws.async_read(buffer, [this](beast::error_code, std::size_t) { reading = false; });
        }
        ioc.restart();
        ioc.run_for(d);
    }

    int pings = 0;
    bool reading = false;
};

std::string field(const json::object& obj, const char* key) {
    return std::string(obj.at(key).as_string().c_str());
}

} // namespace

class BridgeEndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.address = "127.0.0.1";
        cfg.port = 0;
        cfg.guest_url = "http://guests.test";
        cfg.empty_grace = 1s;
        cfg.ping_interval = 1s;

        bridge = std::make_unique<Bridge>(ioc, cfg);
        bridge->start();
        runner = std::thread([this] { ioc.run(); });
    }

    void TearDown() override {
        bridge->stop();
        ioc.stop();
        runner.join();
        bridge.reset();
    }

    http::response<http::string_body> request(http::verb verb, const std::string& target) {
        asio::io_context client;
        beast::tcp_stream stream(client);
        stream.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), bridge->port()));

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.keep_alive(false);
        req.prepare_payload();
        http::write(stream, req);

        // A HEAD response announces a length but carries no body.
        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.skip(verb == http::verb::head);
        http::read(stream, buffer, parser);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return parser.release();
    }

    template <typename Pred>
    static bool eventually(Pred pred) {
        for (int i = 0; i < 50; ++i) {
            if (pred()) return true;
            std::this_thread::sleep_for(100ms);
        }
        return pred();
    }

    json::object create_session() {
        const auto res = request(http::verb::post, "/api/session/create");
        EXPECT_EQ(res.result(), http::status::ok);
        return json::parse(res.body()).as_object();
    }

    config::Config cfg;
    asio::io_context ioc;
    std::unique_ptr<Bridge> bridge;
    std::thread runner;
};

TEST_F(BridgeEndToEndTest, HealthAnswersOverHttp) {
    const auto res = request(http::verb::get, "/health");

    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::access_control_allow_origin], "*");
    const auto body = json::parse(res.body()).as_object();
    EXPECT_EQ(field(body, "status"), "ok");
}

TEST_F(BridgeEndToEndTest, HostAndGuestRelayThenSessionExpires) {
    const auto created = create_session();
    const auto id = field(created, "sessionId");
    const auto secret = field(created, "hostSecret");
    EXPECT_EQ(field(created, "guestUrl"), "http://guests.test/join/" + id);

    WsClient host;
    ASSERT_FALSE(host.open(bridge->port(), "sessionId=" + id + "&role=host&secret=" + secret));
    auto m = host.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "type"), "connected");
    EXPECT_EQ(field(*m, "role"), "host");
    EXPECT_EQ(field(*m, "sessionId"), id);

    WsClient guest;
    ASSERT_FALSE(guest.open(bridge->port(), "sessionId=" + id + "&role=guest"));
    m = guest.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "type"), "connected");
    EXPECT_EQ(field(*m, "role"), "guest");

    m = host.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "type"), "guest_joined");
    EXPECT_EQ(field(*m, "guestId").size(), 36u);

    auto info = json::parse(request(http::verb::get, "/api/session/" + id).body()).as_object();
    EXPECT_TRUE(info.at("hasHost").as_bool());
    EXPECT_TRUE(info.at("hasGuest").as_bool());

    ASSERT_FALSE(host.write(R"({"type":"message","text":"hi"})"));
    m = guest.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "type"), "message");
    EXPECT_EQ(field(*m, "text"), "hi");
    EXPECT_EQ(field(*m, "sender"), "host");
    EXPECT_TRUE(m->contains("timestamp"));

    ASSERT_FALSE(guest.write(R"({"type":"reply","text":"salut"})"));
    m = host.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "sender"), "guest");

    // Garbage is dropped without closing the connection.
    ASSERT_FALSE(host.write("not json"));
    ASSERT_FALSE(host.write(R"({"type":"after"})"));
    m = guest.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "type"), "after");

    ASSERT_FALSE(guest.close());
    m = host.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "type"), "guest_left");

    ASSERT_FALSE(host.close());

    bool gone = false;
    for (int i = 0; i < 50 && !gone; ++i) {
        std::this_thread::sleep_for(100ms);
        gone = request(http::verb::get, "/api/session/" + id).result() == http::status::not_found;
    }
    EXPECT_TRUE(gone);
}

TEST_F(BridgeEndToEndTest, WrongHostSecretIsClosedWithPolicyViolation) {
    const auto id = field(create_session(), "sessionId");

    WsClient intruder;
    ASSERT_FALSE(intruder.open(bridge->port(), "sessionId=" + id + "&role=host&secret=guess"));

    EXPECT_FALSE(intruder.read());
    EXPECT_EQ(intruder.ws.reason().code, websocket::close_code::policy_error);

    auto info = json::parse(request(http::verb::get, "/api/session/" + id).body()).as_object();
    EXPECT_FALSE(info.at("hasHost").as_bool());
}

TEST_F(BridgeEndToEndTest, MissingParametersAreClosedWithPolicyViolation) {
    WsClient stray;
    ASSERT_FALSE(stray.open(bridge->port(), "role=guest"));

    EXPECT_FALSE(stray.read());
    EXPECT_EQ(stray.ws.reason().code, websocket::close_code::policy_error);
}

TEST_F(BridgeEndToEndTest, UnknownSessionIsNotFoundOverHttp) {
    const auto res = request(http::verb::get, "/api/session/ZZZZZZZZ");
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(BridgeEndToEndTest, HeadReportsLengthWithoutBody) {
    const auto get = request(http::verb::get, "/health");
    const auto head = request(http::verb::head, "/health");

    ASSERT_EQ(head.result(), http::status::ok);
    EXPECT_TRUE(head.body().empty());
    EXPECT_EQ(head[http::field::content_type], "application/json; charset=utf-8");
    EXPECT_FALSE(head[http::field::content_length].empty());
    EXPECT_FALSE(get.body().empty());
}

TEST_F(BridgeEndToEndTest, HostMayPresentSecretAsClientId) {
    const auto created = create_session();
    const auto id = field(created, "sessionId");

    WsClient host;
    ASSERT_FALSE(host.open(bridge->port(), "sessionId=" + id + "&role=host&clientId=" + field(created, "hostId")));
    const auto m = host.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "type"), "connected");
    EXPECT_EQ(field(*m, "role"), "host");

    const auto info = json::parse(request(http::verb::get, "/api/session/" + id).body()).as_object();
    EXPECT_TRUE(info.at("hasHost").as_bool());
}

TEST_F(BridgeEndToEndTest, PingsRefreshActivityUntilTheSocketCloses) {
    const auto created = create_session();
    const auto id = field(created, "sessionId");

    WsClient host;
    host.count_pings();
    ASSERT_FALSE(host.open(bridge->port(), "sessionId=" + id + "&role=host&secret=" + field(created, "hostSecret")));
    ASSERT_TRUE(host.read());

    // The guest never reads, so it never answers a ping. It keeps the session
    // bound after the host leaves.
    WsClient guest;
    ASSERT_FALSE(guest.open(bridge->port(), "sessionId=" + id + "&role=guest"));
    auto m = host.read();
    ASSERT_TRUE(m);
    EXPECT_EQ(field(*m, "type"), "guest_joined");

    const auto aged = relay::Session::Clock::now() - 10min;
    ASSERT_TRUE(bridge->registry().update(id, [&](relay::Session& s) { s.last_activity = aged; }));

    // ping_interval is one second.
    host.listen_for(2500ms);
    EXPECT_GE(host.pings, 1);
    EXPECT_GT(bridge->registry().get(id)->last_activity, aged);

    ASSERT_FALSE(host.close());
    EXPECT_TRUE(eventually([&] { return bridge->connection_count() == 1; }));
    EXPECT_TRUE(eventually([&] { return !bridge->registry().get(id)->is_bound(relay::Role::Host); }));

    // Only the silent guest is left: nothing answers a ping any more.
    const auto after_close = bridge->registry().get(id)->last_activity;
    std::this_thread::sleep_for(2500ms);
    ASSERT_TRUE(bridge->registry().get(id));
    EXPECT_EQ(bridge->registry().get(id)->last_activity, after_close);
}

TEST_F(BridgeEndToEndTest, StopClosesLiveSocketsAsGoingAway) {
    const auto created = create_session();
    const auto id = field(created, "sessionId");

    WsClient host;
    ASSERT_FALSE(host.open(bridge->port(), "sessionId=" + id + "&role=host&secret=" + field(created, "hostSecret")));
    ASSERT_TRUE(host.read());

    bridge->stop();

    EXPECT_FALSE(host.read());
    EXPECT_EQ(host.ws.reason().code, websocket::close_code::going_away);
    EXPECT_TRUE(eventually([&] { return bridge->connection_count() == 0; }));
}
