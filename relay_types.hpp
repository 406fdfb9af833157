#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>

#include <cstddef>
#include <cstdint>

namespace websockify {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Client-facing leg of a session.
using WsStream = websocket::stream<beast::tcp_stream>;

constexpr std::size_t kDefaultReadChunkSize = 4096;

enum class Direction { ws_to_tcp, tcp_to_ws };

enum class PumpState { idle, running, cancelled, finished };

enum class SessionState { negotiating, connecting, forwarding, draining, closed };

// local_error  = unexpected fault on the WebSocket (client) leg
// remote_error = unexpected fault on the TCP (target service) leg
enum class TerminationCause { peer_closed, local_error, remote_error, normal_eof };

const char* to_string(Direction d);
const char* to_string(PumpState s);
const char* to_string(SessionState s);
const char* to_string(TerminationCause c);

// True when ec is an orderly end of a transport (clean close, EOF, or an
// operation aborted because we closed the socket ourselves). Anything else
// is a transport fault and gets logged.
bool is_expected_end(const boost::system::error_code& ec);

} // namespace websockify
