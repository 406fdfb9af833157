#include "tcp_connector.hpp"

#include <utility>

namespace websockify {

// ------------------------------ TcpConnection --------------------------------
TcpConnection::TcpConnection(tcp::socket&& socket) : socket_(std::move(socket)) {}

TcpConnection::~TcpConnection() { close(); }

void TcpConnection::half_close() {
    if (is_closing()) return;
    write_closed_ = true;
    beast::error_code ignore;
    socket_.shutdown(tcp::socket::shutdown_send, ignore);
}

void TcpConnection::close() {
    if (closed_) return;
    closed_ = true;
    beast::error_code ignore;
    socket_.shutdown(tcp::socket::shutdown_both, ignore);
    socket_.close(ignore);
}

void TcpConnection::cancel() {
    if (closed_) return;
    beast::error_code ignore;
    socket_.cancel(ignore);
}

// ------------------------------ TcpConnector ---------------------------------
std::string ConnectError::message() const {
    return "Could not connect to " + host + ":" + std::to_string(port) + ": " + cause.message();
}

TcpConnector::TcpConnector(net::any_io_executor ex, std::string host)
    : host_(std::move(host)), resolver_(ex), socket_(ex) {}

void TcpConnector::async_connect(std::uint16_t port, Handler handler) {
    port_ = port;
    resolver_.async_resolve(host_, std::to_string(port),
        [this, handler = std::move(handler)](beast::error_code ec,
                                             tcp::resolver::results_type results) mutable {
            on_resolve(std::move(handler), ec, std::move(results));
        });
}

void TcpConnector::on_resolve(Handler handler, beast::error_code ec,
                              tcp::resolver::results_type results) {
    if (ec) return fail(std::move(handler), ec);

    net::async_connect(socket_, results,
        [this, handler = std::move(handler)](beast::error_code ec, const tcp::endpoint&) mutable {
            on_connect(std::move(handler), ec);
        });
}

void TcpConnector::on_connect(Handler handler, beast::error_code ec) {
    if (ec) return fail(std::move(handler), ec);
    handler(std::nullopt, std::move(socket_));
}

void TcpConnector::fail(Handler handler, beast::error_code ec) {
    beast::error_code ignore;
    socket_.close(ignore);
    handler(ConnectError{host_, port_, ec}, std::move(socket_));
}

} // namespace websockify
