#pragma once

#include "relay_config.hpp"

#include <string>

namespace websockify {

// Example config (websockify.json):
// {
//   "listen_host": "localhost",
//   "listen_port": 22273,
//   "doc_root": "dist",
//   "serve_static": true,
//   "target_host": "localhost",
//   "ws_path_prefix": "/ws/",
//   "read_chunk_size": 4096,
//   "threads": 1,
//   "handshake_timeout_sec": 30
// }
//
// Only the keys present override cfg_out. Returns false (and logs) when the
// file cannot be read, is not valid JSON, or holds a value of the wrong type
// or out of range; cfg_out is left untouched in that case.
bool load_config(const std::string& path, RelayConfig& cfg_out);

enum class CliStatus { run, help, error };

// --config FILE is applied first, every other flag overrides it.
CliStatus parse_cli(int argc, char** argv, RelayConfig& cfg_out);

void print_usage(const char* argv0);

} // namespace websockify
