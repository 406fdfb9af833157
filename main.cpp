// main.cpp - websockify: bridge WebSocket clients to local TCP services.
//
// Serves the UI from --doc-root at "/" and relays ws://HOST:PORT/ws/{port}
// to localhost:{port}, raw bytes both ways.
//
// Run:
//   ./websockify --config ./websockify.json
//
// CLI works without a config file:
//   ./websockify --host localhost --port 22273 --doc-root ./dist

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

#include "config.hpp"
#include "relay_server.hpp"

namespace websockify {

// --------------------------- signals -----------------------------------------
static std::atomic<bool> g_interrupted = false;
static void handle_signal(int) { g_interrupted = true; }

} // namespace websockify

int main(int argc, char** argv) {
    using namespace websockify;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    RelayConfig cfg;
    switch (parse_cli(argc, argv, cfg)) {
        case CliStatus::help:  return 0;
        case CliStatus::error: return 2;
        case CliStatus::run:   break;
    }

    try {
        RelayServer server;
        if (!server.start(cfg)) return 1;

        while (!g_interrupted) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        server.stop();
    } catch (const std::exception& e) {
        std::cerr << "[server] fatal: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
