#include "http_session.hpp"
#include "relay_session.hpp"

#include <boost/beast/version.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace websockify {

namespace http = boost::beast::http;

static constexpr std::uint64_t kRequestBodyLimit = 64 * 1024;
static constexpr auto kRequestTimeout = std::chrono::seconds(30);

static http::response<http::string_body>
plain_response(http::status status, unsigned version, beast::string_view body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(false);
    res.body() = std::string(body);
    res.prepare_payload();
    return res;
}

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<const RelayConfig> config)
    : stream_(std::move(socket)),
      config_(std::move(config)),
      files_(config_->doc_root) {}

template <bool IsRequest, class Body>
void HttpSession::send(http::message<IsRequest, Body>&& msg) {
    bool const close = msg.need_eof();

    // The message has to outlive the write.
    auto sp = std::make_shared<http::message<IsRequest, Body>>(std::move(msg));
    response_ = sp;

    http::async_write(stream_, *sp,
                      beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), close));
}

void HttpSession::run() {
    // Get onto the connection's strand before touching the stream.
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    parser_.emplace();
    parser_->body_limit(kRequestBodyLimit);

    stream_.expires_after(kRequestTimeout);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) return do_close();
    if (ec) {
        if (ec != beast::error::timeout && !is_expected_end(ec))
            std::cerr << "[http] read error: " << ec.message() << "\n";
        return;
    }

    if (websocket::is_upgrade(parser_->get())) return handle_upgrade();

    if (!config_->serve_static) {
        auto const& req = parser_->get();
        return send(plain_response(http::status::not_found, req.version(), "Not Found"));
    }

    files_.handle(parser_->get(), [this](auto&& msg) { send(std::move(msg)); });
}

void HttpSession::handle_upgrade() {
    auto req = parser_->release();

    if (!matches_ws_route(req.target(), config_->ws_path_prefix)) {
        std::cerr << "[http] no WebSocket route for " << req.target() << "\n";
        return send(plain_response(http::status::not_found, req.version(), "Not Found"));
    }

    auto port = parse_ws_port(req.target(), config_->ws_path_prefix);
    if (!port) {
        std::cerr << "[http] invalid target port in " << req.target() << "\n";
        return send(plain_response(http::status::bad_request, req.version(), "Invalid port"));
    }

    std::make_shared<RelaySession>(std::move(stream_), *port, config_)->run(std::move(req));
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    response_.reset();
    if (ec) {
        if (!is_expected_end(ec))
            std::cerr << "[http] write error: " << ec.message() << "\n";
        return;
    }
    if (close) return do_close();
    do_read();
}

void HttpSession::do_close() {
    beast::error_code ignore;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ignore);
}

} // namespace websockify
