#pragma once

#include "pump.hpp"
#include "relay_config.hpp"
#include "relay_types.hpp"
#include "tcp_connector.hpp"

#include <boost/beast/http.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace websockify {

// Pairs one accepted WebSocket with one TCP connection to the target port.
//
//   negotiating -> connecting -> forwarding -> draining -> closed
//
// Both pumps run on the connection's strand. The first one to finish wins:
// the other is cancelled, the TCP socket is closed, and the session ends
// once both pumps have reported. A failed connect closes the WebSocket with
// 1011 and never starts a pump.
class RelaySession : public std::enable_shared_from_this<RelaySession> {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    RelaySession(beast::tcp_stream&& stream, std::uint16_t port,
                 std::shared_ptr<const RelayConfig> config);
    ~RelaySession();

    // Completes the WebSocket handshake for req and drives the session.
    void run(Request req);

    SessionState state() const { return state_; }
    std::optional<TerminationCause> cause() const { return cause_; }
    std::uint16_t port() const { return port_; }

    // nullptr until the TCP leg is connected; never set after a failed connect.
    const Pump* pump(Direction direction) const;

private:
    void on_accept(beast::error_code ec);
    void on_connect(std::optional<ConnectError> err, tcp::socket socket);
    void on_pump_done(Direction direction, TerminationCause cause);
    void close();

    std::string target() const;

    WsStream ws_;
    std::uint16_t port_;
    std::shared_ptr<const RelayConfig> config_;

    SessionState state_ = SessionState::negotiating;
    std::optional<TerminationCause> cause_;
    std::optional<std::string> subprotocol_;

    TcpConnector connector_;
    std::unique_ptr<TcpConnection> tcp_;
    std::unique_ptr<WsToTcpPump> ws_to_tcp_;
    std::unique_ptr<TcpToWsPump> tcp_to_ws_;
    int pumps_finished_ = 0;
};

} // namespace websockify
