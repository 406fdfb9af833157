#pragma once

#include "relay_types.hpp"
#include "tcp_connector.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace websockify {

// One direction of a session. A pump runs a single sequential
// read -> write loop until its source ends, a transport fails, or it is
// cancelled, then reports once through the done handler. Errors never
// leave the pump; they only decide the reported TerminationCause.
class Pump {
public:
    using DoneHandler = std::function<void(Direction, TerminationCause)>;

    explicit Pump(Direction direction) : direction_(direction) {}
    virtual ~Pump() = default;

    Pump(const Pump&) = delete;
    Pump& operator=(const Pump&) = delete;

    // Every pending operation holds owner, so the streams outlive them.
    // The pump itself only keeps a weak reference.
    void start(const std::shared_ptr<void>& owner, DoneHandler on_done);

    // Cooperative: the loop stops at its next suspension point.
    void cancel();

    Direction direction() const { return direction_; }
    PumpState state() const { return state_; }
    std::uint64_t bytes_forwarded() const { return bytes_; }

protected:
    virtual void run() = 0;
    virtual void on_cancel() = 0;

    bool cancelled() const { return state_ == PumpState::cancelled; }
    std::shared_ptr<void> keep_alive() const { return owner_.lock(); }
    void add_bytes(std::size_t n) { bytes_ += n; }
    void finish(TerminationCause cause);

private:
    Direction direction_;
    PumpState state_ = PumpState::idle;
    std::uint64_t bytes_ = 0;
    std::weak_ptr<void> owner_;
    DoneHandler on_done_;
};

// Reads whole WebSocket messages and writes each to the TCP stream, waiting
// for the write to complete before reading the next one.
class WsToTcpPump : public Pump {
public:
    WsToTcpPump(WsStream& ws, TcpConnection& tcp);

protected:
    void run() override;
    void on_cancel() override;

private:
    void read_next();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(beast::error_code ec, std::size_t bytes);
    void stop(TerminationCause cause);

    WsStream& ws_;
    TcpConnection& tcp_;
    beast::flat_buffer buffer_;
};

// Reads up to chunk_size bytes from TCP and sends each read as one binary
// WebSocket message. Closes the WebSocket on exit.
class TcpToWsPump : public Pump {
public:
    TcpToWsPump(WsStream& ws, TcpConnection& tcp, std::size_t chunk_size = kDefaultReadChunkSize);

protected:
    void run() override;
    void on_cancel() override;

private:
    void read_next();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(beast::error_code ec, std::size_t bytes);
    void stop(TerminationCause cause);

    WsStream& ws_;
    TcpConnection& tcp_;
    std::vector<char> chunk_;
};

} // namespace websockify
