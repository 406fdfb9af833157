#include "pump.hpp"

#include <iostream>
#include <utility>

namespace websockify {

// ----------------------------------- Pump ------------------------------------
void Pump::start(const std::shared_ptr<void>& owner, DoneHandler on_done) {
    if (state_ != PumpState::idle) return;
    owner_ = owner;
    on_done_ = std::move(on_done);
    state_ = PumpState::running;
    run();
}

void Pump::cancel() {
    if (state_ != PumpState::running) return;
    state_ = PumpState::cancelled;
    on_cancel();
}

void Pump::finish(TerminationCause cause) {
    if (state_ == PumpState::finished) return;
    state_ = PumpState::finished;

    auto on_done = std::move(on_done_);
    if (on_done) on_done(direction_, cause);
}

// -------------------------------- WS -> TCP ----------------------------------
WsToTcpPump::WsToTcpPump(WsStream& ws, TcpConnection& tcp)
    : Pump(Direction::ws_to_tcp), ws_(ws), tcp_(tcp) {}

void WsToTcpPump::run() { read_next(); }

void WsToTcpPump::on_cancel() {
    // The sibling already closed the WebSocket; make sure a read still
    // parked on the dead stream gets released.
    beast::get_lowest_layer(ws_).cancel();
    tcp_.cancel();
}

void WsToTcpPump::read_next() {
    if (cancelled()) return stop(TerminationCause::peer_closed);

    ws_.async_read(buffer_,
        [this, owner = keep_alive()](beast::error_code ec, std::size_t bytes) { on_read(ec, bytes); });
}

void WsToTcpPump::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        if (is_expected_end(ec)) return stop(TerminationCause::peer_closed);
        std::cerr << "[relay] Error forwarding WS to TCP: " << ec.message() << "\n";
        return stop(TerminationCause::local_error);
    }

    // An empty message is the client's way of saying it is done.
    if (bytes == 0 || cancelled()) return stop(TerminationCause::peer_closed);

    net::async_write(tcp_.socket(), buffer_.data(),
        [this, owner = keep_alive()](beast::error_code ec, std::size_t bytes) { on_write(ec, bytes); });
}

void WsToTcpPump::on_write(beast::error_code ec, std::size_t bytes) {
    buffer_.consume(buffer_.size());
    if (ec) {
        if (!is_expected_end(ec))
            std::cerr << "[relay] Error forwarding WS to TCP: " << ec.message() << "\n";
        return stop(TerminationCause::remote_error);
    }
    add_bytes(bytes);
    read_next();
}

void WsToTcpPump::stop(TerminationCause cause) {
    // Client-initiated close must reach the TCP peer as EOF.
    if (!tcp_.is_closing()) tcp_.half_close();
    finish(cause);
}

// -------------------------------- TCP -> WS ----------------------------------
TcpToWsPump::TcpToWsPump(WsStream& ws, TcpConnection& tcp, std::size_t chunk_size)
    : Pump(Direction::tcp_to_ws), ws_(ws), tcp_(tcp),
      chunk_(chunk_size ? chunk_size : kDefaultReadChunkSize) {}

void TcpToWsPump::run() { read_next(); }

void TcpToWsPump::on_cancel() { tcp_.cancel(); }

void TcpToWsPump::read_next() {
    if (cancelled()) return stop(TerminationCause::normal_eof);

    tcp_.socket().async_read_some(net::buffer(chunk_),
        [this, owner = keep_alive()](beast::error_code ec, std::size_t bytes) { on_read(ec, bytes); });
}

void TcpToWsPump::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        if (is_expected_end(ec)) return stop(TerminationCause::normal_eof);
        std::cerr << "[relay] Error forwarding TCP to WS: " << ec.message() << "\n";
        return stop(TerminationCause::remote_error);
    }
    if (bytes == 0 || cancelled()) return stop(TerminationCause::normal_eof);

    ws_.binary(true);
    ws_.async_write(net::buffer(chunk_.data(), bytes),
        [this, owner = keep_alive()](beast::error_code ec, std::size_t bytes) { on_write(ec, bytes); });
}

void TcpToWsPump::on_write(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        if (!is_expected_end(ec))
            std::cerr << "[relay] Error forwarding TCP to WS: " << ec.message() << "\n";
        return stop(TerminationCause::local_error);
    }
    add_bytes(bytes);
    read_next();
}

void TcpToWsPump::stop(TerminationCause cause) {
    // TCP side is gone: the client has to see the WebSocket close.
    if (!ws_.is_open()) return finish(cause);

    ws_.async_close(websocket::close_code::normal,
        [this, owner = keep_alive(), cause](beast::error_code) { finish(cause); });
}

} // namespace websockify
