#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace websockify {

void print_usage(const char* argv0) {
    std::cerr <<
    "Usage:\n"
    "  " << argv0 << " [--config FILE.json]\n"
    "               [--host HOST] [--port PORT]\n"
    "               [--doc-root DIR] [--no-static]\n"
    "               [--target-host HOST] [--ws-prefix PATH]\n"
    "               [--chunk-size BYTES] [--threads N]\n";
}

// Signed on purpose: "-1" must fail here, not wrap to a huge unsigned value.
template <class T>
static T to_bounded(long long v, long long lo, long long hi, const char* name) {
    if (v < lo || v > hi)
        throw std::out_of_range(std::string(name) + " must be in " + std::to_string(lo) + ".." + std::to_string(hi));
    return static_cast<T>(v);
}

static std::uint16_t to_port(long long v) {
    return to_bounded<std::uint16_t>(v, 0, 65535, "port");
}

static std::size_t to_chunk_size(long long v) {
    return to_bounded<std::size_t>(v, 1, static_cast<long long>(kMaxReadChunkSize), "read_chunk_size");
}

static unsigned to_threads(long long v) {
    return to_bounded<unsigned>(v, 1, kMaxThreads, "threads");
}

bool load_config(const std::string& path, RelayConfig& cfg_out) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[config] Cannot open: " << path << "\n";
        return false;
    }

    RelayConfig cfg = cfg_out;
    try {
        json j; f >> j;
        if (!j.is_object()) {
            std::cerr << "[config] " << path << ": top level must be an object\n";
            return false;
        }

        if (j.contains("listen_host")) cfg.listen_host = j["listen_host"].get<std::string>();
        if (j.contains("listen_port")) cfg.listen_port = to_port(j["listen_port"].get<long long>());
        if (j.contains("doc_root")) cfg.doc_root = j["doc_root"].get<std::string>();
        if (j.contains("serve_static")) cfg.serve_static = j["serve_static"].get<bool>();
        if (j.contains("target_host")) cfg.target_host = j["target_host"].get<std::string>();
        if (j.contains("ws_path_prefix")) cfg.ws_path_prefix = j["ws_path_prefix"].get<std::string>();
        if (j.contains("read_chunk_size")) cfg.read_chunk_size = to_chunk_size(j["read_chunk_size"].get<long long>());
        if (j.contains("threads")) cfg.threads = to_threads(j["threads"].get<long long>());
        if (j.contains("handshake_timeout_sec")) cfg.handshake_timeout_sec = to_bounded<unsigned>(
            j["handshake_timeout_sec"].get<long long>(), 1, kMaxHandshakeTimeoutSec, "handshake_timeout_sec");
    } catch (const json::exception& e) {
        std::cerr << "[config] " << path << ": " << e.what() << "\n";
        return false;
    } catch (const std::out_of_range& e) {
        std::cerr << "[config] " << path << ": " << e.what() << "\n";
        return false;
    }

    if (cfg.ws_path_prefix.empty()) {
        std::cerr << "[config] " << path << ": ws_path_prefix must not be empty\n";
        return false;
    }

    cfg_out = std::move(cfg);
    return true;
}

CliStatus parse_cli(int argc, char** argv, RelayConfig& cfg_out) {
    // First pass: the config file is the base layer.
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h") { print_usage(argv[0]); return CliStatus::help; }
        if (a == "--config") {
            if (i + 1 >= argc) { std::cerr << "--config requires value\n"; print_usage(argv[0]); return CliStatus::error; }
            if (!load_config(argv[i + 1], cfg_out)) return CliStatus::error;
            ++i;
        }
    }

    // Second pass: flags override the file.
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto need = [&](const char* name) {
                if (i + 1 >= argc) throw std::invalid_argument(std::string(name) + " requires value");
                return std::string(argv[++i]);
            };
            if (a == "--config") ++i;
            else if (a == "--host") cfg_out.listen_host = need("--host");
            else if (a == "--port") cfg_out.listen_port = to_port(std::stoll(need("--port")));
            else if (a == "--doc-root") cfg_out.doc_root = need("--doc-root");
            else if (a == "--no-static") cfg_out.serve_static = false;
            else if (a == "--target-host") cfg_out.target_host = need("--target-host");
            else if (a == "--ws-prefix") cfg_out.ws_path_prefix = need("--ws-prefix");
            else if (a == "--chunk-size") cfg_out.read_chunk_size = to_chunk_size(std::stoll(need("--chunk-size")));
            else if (a == "--threads") cfg_out.threads = to_threads(std::stoll(need("--threads")));
            else { std::cerr << "Unknown arg: " << a << "\n"; print_usage(argv[0]); return CliStatus::error; }
        }
    } catch (const std::logic_error& e) {
        // need(), std::stoll, to_bounded: invalid_argument and out_of_range
        std::cerr << "Invalid value: " << e.what() << "\n";
        print_usage(argv[0]);
        return CliStatus::error;
    }

    if (cfg_out.ws_path_prefix.empty()) {
        std::cerr << "--ws-prefix must not be empty\n";
        return CliStatus::error;
    }
    return CliStatus::run;
}

} // namespace websockify
