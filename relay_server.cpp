#include "relay_server.hpp"
#include "http_session.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>

#include <atomic>
#include <exception>
#include <iostream>

namespace websockify {

struct RelayServer::Impl {
    std::shared_ptr<const RelayConfig> config;
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::uint16_t bound_port = 0;

    std::atomic<bool> running{false};

    void do_accept() {
        acceptor->async_accept(
            net::make_strand(ioc),
            [this](beast::error_code ec, tcp::socket socket) {
                if (!running.load()) return;

                if (ec) {
                    std::cerr << "[server] accept: " << ec.message() << "\n";
                } else {
                    std::make_shared<HttpSession>(std::move(socket), config)->run();
                }
                do_accept();
            });
    }
};

RelayServer::RelayServer() : impl_(std::make_unique<Impl>()) {}

RelayServer::~RelayServer() { stop(); }

bool RelayServer::start(const RelayConfig& config) {
    if (impl_->running.exchange(true)) return true;

    impl_->config = std::make_shared<const RelayConfig>(config);

    beast::error_code ec;

    tcp::resolver resolver(impl_->ioc);
    auto results = resolver.resolve(config.listen_host, std::to_string(config.listen_port),
                                    tcp::resolver::passive, ec);
    if (ec || results.empty()) {
        std::cerr << "[server] resolve " << config.listen_host << ": " << ec.message() << "\n";
        impl_->running = false;
        return false;
    }
    tcp::endpoint endpoint = results.begin()->endpoint();

    impl_->acceptor = std::make_unique<tcp::acceptor>(impl_->ioc);

    impl_->acceptor->open(endpoint.protocol(), ec);
    if (ec) { std::cerr << "[server] acceptor open: " << ec.message() << "\n"; impl_->running = false; return false; }

    impl_->acceptor->set_option(net::socket_base::reuse_address(true), ec);
    if (ec) { std::cerr << "[server] set_option: " << ec.message() << "\n"; impl_->running = false; return false; }

    impl_->acceptor->bind(endpoint, ec);
    if (ec) { std::cerr << "[server] bind: " << ec.message() << "\n"; impl_->running = false; return false; }

    impl_->acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) { std::cerr << "[server] listen: " << ec.message() << "\n"; impl_->running = false; return false; }

    impl_->bound_port = impl_->acceptor->local_endpoint(ec).port();

    impl_->do_accept();

    std::cout << "[server] listening on " << config.listen_host << ":" << impl_->bound_port
              << " (ws route " << config.ws_path_prefix << "{port} -> "
              << config.target_host << ":{port}";
    if (config.serve_static) std::cout << ", static root " << config.doc_root;
    std::cout << ")" << std::endl;

    unsigned const n = config.threads ? config.threads : 1;
    io_threads_.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        io_threads_.emplace_back([this]() {
            for (;;) {
                try {
                    impl_->ioc.run();
                    break;
                } catch (const std::exception& e) {
                    std::cerr << "[server] session crashed: " << e.what() << "\n";
                }
            }
        });
    }

    return true;
}

void RelayServer::stop() {
    if (!impl_->running.exchange(false)) return;
    beast::error_code ec;
    if (impl_->acceptor) {
        impl_->acceptor->cancel(ec);
        impl_->acceptor->close(ec);
    }
    impl_->ioc.stop();
    for (auto& t : io_threads_) {
        if (t.joinable()) t.join();
    }
    io_threads_.clear();

    // Sessions still in flight are owned by their pending handlers. Dropping
    // the context destroys those handlers, which closes every socket.
    impl_ = std::make_unique<Impl>();
    std::cout << "[server] stopped" << std::endl;
}

bool RelayServer::running() const { return impl_->running.load(); }

std::uint16_t RelayServer::local_port() const { return impl_->bound_port; }

} // namespace websockify
