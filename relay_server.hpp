#pragma once

#include "relay_config.hpp"

#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace websockify {

// Listens on config.listen_host:listen_port, serves the static UI and
// bridges /ws/{port} WebSocket connections to localhost:{port}.
class RelayServer {
public:
    RelayServer();
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    bool start(const RelayConfig& config);
    void stop();

    bool running() const;

    // Port actually bound; useful when listen_port is 0.
    std::uint16_t local_port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::vector<std::thread> io_threads_;
};

} // namespace websockify
