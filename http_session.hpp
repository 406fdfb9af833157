#pragma once

#include "relay_config.hpp"
#include "relay_types.hpp"
#include "static_files.hpp"

#include <boost/beast/http.hpp>

#include <memory>
#include <optional>

namespace websockify {

// Front door for one accepted connection. Plain HTTP requests are answered
// from the document root; a WebSocket upgrade on <prefix>{port} hands the
// stream over to a RelaySession.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<const RelayConfig> config);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes);
    void on_write(bool close, beast::error_code ec, std::size_t bytes);
    void do_close();

    void handle_upgrade();

    template <bool IsRequest, class Body>
    void send(boost::beast::http::message<IsRequest, Body>&& msg);

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<const RelayConfig> config_;
    StaticFiles files_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
    std::shared_ptr<void> response_;
};

} // namespace websockify
