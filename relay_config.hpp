#pragma once

#include "relay_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace websockify {

// Upper bounds accepted from the config file and the command line.
inline constexpr std::size_t kMaxReadChunkSize = 16 * 1024 * 1024;
inline constexpr unsigned    kMaxThreads = 256;
inline constexpr unsigned    kMaxHandshakeTimeoutSec = 3600;

struct RelayConfig {
    std::string   listen_host = "localhost";
    std::uint16_t listen_port = 22273;          // 0 = ephemeral

    std::string   doc_root = "dist";
    bool          serve_static = true;

    std::string   target_host = "localhost";    // every session connects here
    std::string   ws_path_prefix = "/ws/";      // route is <prefix>{port}

    std::size_t   read_chunk_size = kDefaultReadChunkSize;
    unsigned      threads = 1;
    unsigned      handshake_timeout_sec = 30;
};

} // namespace websockify
