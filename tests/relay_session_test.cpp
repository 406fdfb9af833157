#include "relay_server.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <vector>

using namespace websockify;
using namespace websockify::test;
using namespace std::chrono_literals;

class RelaySessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        RelayConfig cfg;
        cfg.listen_host = "127.0.0.1";
        cfg.listen_port = 0;
        cfg.target_host = "127.0.0.1";
        cfg.serve_static = false;
        ASSERT_TRUE(server_.start(cfg));
        ASSERT_NE(server_.local_port(), 0);
    }

    void TearDown() override { server_.stop(); }

    std::string route(std::uint16_t port) const { return "/ws/" + std::to_string(port); }

    RelayServer server_;
    net::io_context backend_ioc_;
    tcp::acceptor backend_{backend_ioc_, loopback(0)};
    std::uint16_t backend_port() const { return backend_.local_endpoint().port(); }
};

TEST_F(RelaySessionTest, MessagesArriveAtTcpInOrder) {
    auto received = std::async(std::launch::async, [this] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        return read_until_eof(s);
    });

    WsClient client;
    client.connect(server_.local_port(), route(backend_port()));
    client.ws.binary(true);
    std::vector<std::string> messages = {"first ", "second ", std::string(10000, 'x'), " last"};
    std::string expected;
    for (const auto& m : messages) {
        client.ws.write(net::buffer(m));
        expected += m;
    }
    client.ws.close(websocket::close_code::normal);

    ASSERT_EQ(received.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(received.get(), expected);
}

TEST_F(RelaySessionTest, TcpBytesArriveAsBoundedMessages) {
    std::string payload;
    for (int i = 0; i < 20000; ++i) payload.push_back(static_cast<char>(i % 251));

    auto sent = std::async(std::launch::async, [this, &payload] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        net::write(s, net::buffer(payload));
        s.shutdown(tcp::socket::shutdown_both);
        s.close();
    });

    WsClient client;
    client.connect(server_.local_port(), route(backend_port()));

    std::size_t largest = 0;
    beast::error_code last;
    std::string got = client.read_until_closed(&largest, &last);

    ASSERT_EQ(sent.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(got, payload);
    EXPECT_LE(largest, kDefaultReadChunkSize);
    EXPECT_EQ(last, websocket::error::closed);
    EXPECT_EQ(client.ws.reason().code, websocket::close_code::normal);
}

TEST_F(RelaySessionTest, EchoRoundTripIsByteExact) {
    auto echo = std::async(std::launch::async, [this] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        char buf[512];
        beast::error_code ec;
        for (;;) {
            std::size_t n = s.read_some(net::buffer(buf), ec);
            if (ec) break;
            net::write(s, net::buffer(buf, n), ec);
            if (ec) break;
        }
    });

    std::string all_bytes;
    for (int b = 0; b < 256; ++b) all_bytes.push_back(static_cast<char>(b));

    WsClient client;
    client.connect(server_.local_port(), route(backend_port()));
    client.ws.binary(true);
    client.ws.write(net::buffer(all_bytes));

    std::string got;
    while (got.size() < all_bytes.size()) {
        beast::flat_buffer buffer;
        client.ws.read(buffer);
        EXPECT_TRUE(client.ws.got_binary());
        got += beast::buffers_to_string(buffer.data());
    }
    EXPECT_EQ(got, all_bytes);

    client.ws.close(websocket::close_code::normal);
    EXPECT_EQ(echo.wait_for(5s), std::future_status::ready);
}

TEST_F(RelaySessionTest, ConnectFailureClosesWith1011) {
    WsClient client;
    client.connect(server_.local_port(), route(unused_port()));

    beast::error_code last;
    std::string got = client.read_until_closed(nullptr, &last);

    EXPECT_TRUE(got.empty());
    EXPECT_EQ(last, websocket::error::closed);
    EXPECT_EQ(client.ws.reason().code, websocket::close_code::internal_error);
}

TEST_F(RelaySessionTest, ClientCloseReachesTcpAsEof) {
    auto backend = std::async(std::launch::async, [this] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        net::write(s, net::buffer(std::string("hello")));
        return read_until_eof(s);
    });

    WsClient client;
    client.connect(server_.local_port(), route(backend_port()));

    beast::flat_buffer buffer;
    client.ws.read(buffer);
    EXPECT_EQ(beast::buffers_to_string(buffer.data()), "hello");

    client.ws.close(websocket::close_code::normal);

    ASSERT_EQ(backend.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(backend.get(), "");
}

TEST_F(RelaySessionTest, ServerCloseReachesClient) {
    auto backend = std::async(std::launch::async, [this] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        s.close();
    });

    WsClient client;
    client.connect(server_.local_port(), route(backend_port()));

    auto closed = std::async(std::launch::async, [&client] {
        beast::error_code last;
        client.read_until_closed(nullptr, &last);
        return last;
    });

    ASSERT_EQ(closed.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(closed.get(), websocket::error::closed);
    EXPECT_EQ(backend.wait_for(5s), std::future_status::ready);
}

TEST_F(RelaySessionTest, EmptyMessageActsAsClose) {
    auto received = std::async(std::launch::async, [this] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        return read_until_eof(s);
    });

    WsClient client;
    client.connect(server_.local_port(), route(backend_port()));
    client.ws.binary(true);
    client.ws.write(net::buffer(std::string()));
    // Anything after the empty message must not be forwarded.
    beast::error_code ignore;
    client.ws.write(net::buffer(std::string("late")), ignore);

    ASSERT_EQ(received.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(received.get(), "");

    beast::error_code last;
    client.read_until_closed(nullptr, &last);
    EXPECT_TRUE(last);
}

TEST_F(RelaySessionTest, NegotiatesBinarySubprotocol) {
    WsClient client;
    client.connect(server_.local_port(), route(unused_port()), "json, binary");
    EXPECT_EQ(client.response[http::field::sec_websocket_protocol], "binary");
}

TEST_F(RelaySessionTest, OmitsSubprotocolWhenBinaryNotOffered) {
    WsClient client;
    client.connect(server_.local_port(), route(unused_port()), "json");
    EXPECT_EQ(client.response.count(http::field::sec_websocket_protocol), 0u);

    WsClient bare;
    bare.connect(server_.local_port(), route(unused_port()));
    EXPECT_EQ(bare.response.count(http::field::sec_websocket_protocol), 0u);
}

TEST_F(RelaySessionTest, SessionsAreIndependent) {
    auto serve = [this] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        return s;
    };

    WsClient a;
    a.connect(server_.local_port(), route(backend_port()));
    tcp::socket sa = serve();

    WsClient b;
    b.connect(server_.local_port(), route(backend_port()));
    tcp::socket sb = serve();

    // Closing one session's backend leaves the other forwarding.
    sa.close();
    beast::error_code last;
    a.read_until_closed(nullptr, &last);
    EXPECT_EQ(last, websocket::error::closed);

    net::write(sb, net::buffer(std::string("still here")));
    beast::flat_buffer buffer;
    b.ws.read(buffer);
    EXPECT_EQ(beast::buffers_to_string(buffer.data()), "still here");
    b.ws.close(websocket::close_code::normal);
}

TEST_F(RelaySessionTest, StopReleasesLiveSessionsAndServerRestarts) {
    std::promise<std::string> first;
    auto got_first = first.get_future();
    auto backend = std::async(std::launch::async, [this, &first] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        std::string head(9, '\0');
        net::read(s, net::buffer(head));
        first.set_value(head);
        return read_until_eof(s);
    });

    WsClient client;
    client.connect(server_.local_port(), route(backend_port()));
    client.ws.binary(true);
    client.ws.write(net::buffer(std::string("in flight")));

    ASSERT_EQ(got_first.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(got_first.get(), "in flight");

    // The session is still forwarding; stopping must tear it down.
    server_.stop();
    EXPECT_FALSE(server_.running());
    ASSERT_EQ(backend.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(backend.get(), "");

    RelayConfig cfg;
    cfg.listen_host = "127.0.0.1";
    cfg.listen_port = 0;
    cfg.target_host = "127.0.0.1";
    cfg.serve_static = false;
    ASSERT_TRUE(server_.start(cfg));

    auto echo = std::async(std::launch::async, [this] {
        tcp::socket s(backend_ioc_);
        backend_.accept(s);
        net::write(s, net::buffer(std::string("again")));
        return read_until_eof(s);
    });

    WsClient second;
    second.connect(server_.local_port(), route(backend_port()));
    beast::flat_buffer buffer;
    second.ws.read(buffer);
    EXPECT_EQ(beast::buffers_to_string(buffer.data()), "again");
    second.ws.close(websocket::close_code::normal);
    ASSERT_EQ(echo.wait_for(5s), std::future_status::ready);
}
