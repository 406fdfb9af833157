#include "relay_session.hpp"
#include "subprotocol.hpp"

#include <boost/beast/version.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace websockify {

namespace http = boost::beast::http;

RelaySession::RelaySession(beast::tcp_stream&& stream, std::uint16_t port,
                           std::shared_ptr<const RelayConfig> config)
    : ws_(std::move(stream)),
      port_(port),
      config_(std::move(config)),
      connector_(ws_.get_executor(), config_->target_host) {}

RelaySession::~RelaySession() = default;

const Pump* RelaySession::pump(Direction direction) const {
    if (direction == Direction::ws_to_tcp) return ws_to_tcp_.get();
    return tcp_to_ws_.get();
}

std::string RelaySession::target() const {
    return config_->target_host + ":" + std::to_string(port_);
}

void RelaySession::run(Request req) {
    state_ = SessionState::negotiating;
    subprotocol_ = select_subprotocol(req[http::field::sec_websocket_protocol]);

    // The HTTP read deadline must not leak into the relay.
    beast::get_lowest_layer(ws_).expires_never();

    ws_.set_option(websocket::stream_base::timeout{
        std::chrono::seconds(config_->handshake_timeout_sec),
        websocket::stream_base::none(),
        false
    });

    auto proto = subprotocol_;
    ws_.set_option(websocket::stream_base::decorator(
        [proto](websocket::response_type& res) {
            res.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " websockify");
            if (proto) res.set(http::field::sec_websocket_protocol, *proto);
        }));

    ws_.async_accept(req, beast::bind_front_handler(&RelaySession::on_accept, shared_from_this()));
}

void RelaySession::on_accept(beast::error_code ec) {
    if (ec) {
        std::cerr << "[relay] WebSocket accept failed: " << ec.message() << "\n";
        state_ = SessionState::closed;
        return;
    }

    std::cout << "[relay] Client connected. Proxying to " << target()
              << " (Subprotocol: " << (subprotocol_ ? *subprotocol_ : "None") << ")\n";

    state_ = SessionState::connecting;
    auto self = shared_from_this();
    connector_.async_connect(port_,
        [self](std::optional<ConnectError> err, tcp::socket socket) {
            self->on_connect(std::move(err), std::move(socket));
        });
}

void RelaySession::on_connect(std::optional<ConnectError> err, tcp::socket socket) {
    if (err) {
        std::cerr << "[relay] " << err->message() << "\n";
        cause_ = TerminationCause::remote_error;
        ws_.async_close(websocket::close_reason(websocket::close_code::internal_error),
            [self = shared_from_this()](beast::error_code) { self->close(); });
        return;
    }

    tcp_ = std::make_unique<TcpConnection>(std::move(socket));
    ws_to_tcp_ = std::make_unique<WsToTcpPump>(ws_, *tcp_);
    tcp_to_ws_ = std::make_unique<TcpToWsPump>(ws_, *tcp_, config_->read_chunk_size);

    state_ = SessionState::forwarding;
    auto self = shared_from_this();
    auto done = [this](Direction d, TerminationCause c) { on_pump_done(d, c); };
    ws_to_tcp_->start(self, done);
    tcp_to_ws_->start(self, done);
}

void RelaySession::on_pump_done(Direction direction, TerminationCause cause) {
    ++pumps_finished_;

    if (state_ == SessionState::forwarding) {
        state_ = SessionState::draining;
        cause_ = cause;

        Pump& loser = direction == Direction::ws_to_tcp
            ? static_cast<Pump&>(*tcp_to_ws_)
            : static_cast<Pump&>(*ws_to_tcp_);
        loser.cancel();
        tcp_->close();
    }

    if (pumps_finished_ == 2) close();
}

void RelaySession::close() {
    if (state_ == SessionState::closed) return;
    state_ = SessionState::closed;
    if (tcp_) tcp_->close();

    std::cout << "[relay] Connection to " << target() << " closed ("
              << (cause_ ? to_string(*cause_) : "unknown");
    if (ws_to_tcp_ && tcp_to_ws_) {
        std::cout << ", ws->tcp " << ws_to_tcp_->bytes_forwarded()
                  << " bytes, tcp->ws " << tcp_to_ws_->bytes_forwarded() << " bytes";
    }
    std::cout << ")\n";
}

} // namespace websockify
