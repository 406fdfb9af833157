#pragma once

#include "relay_types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace websockify {

// Connected TCP leg of a session. Owned by exactly one RelaySession; both
// pumps and the coordinator may close it, so closing is idempotent.
class TcpConnection {
public:
    explicit TcpConnection(tcp::socket&& socket);
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    tcp::socket& socket() { return socket_; }

    // Send FIN, keep receiving.
    void half_close();
    void close();
    void cancel();

    bool is_closing() const { return write_closed_ || closed_; }
    bool is_closed() const { return closed_; }

private:
    tcp::socket socket_;
    bool write_closed_ = false;
    bool closed_ = false;
};

struct ConnectError {
    std::string host;
    std::uint16_t port = 0;
    boost::system::error_code cause;

    std::string message() const;
};

// Opens a TCP connection to host:port (localhost by default). No retry and
// no timeout beyond what the OS applies to connect().
class TcpConnector {
public:
    using Handler = std::function<void(std::optional<ConnectError>, tcp::socket)>;

    explicit TcpConnector(net::any_io_executor ex, std::string host = "localhost");

    // handler travels with the pending operation; the connector keeps no
    // copy of it.
    void async_connect(std::uint16_t port, Handler handler);

private:
    void on_resolve(Handler handler, beast::error_code ec, tcp::resolver::results_type results);
    void on_connect(Handler handler, beast::error_code ec);
    void fail(Handler handler, beast::error_code ec);

    std::string host_;
    std::uint16_t port_ = 0;
    tcp::resolver resolver_;
    tcp::socket socket_;
};

} // namespace websockify
