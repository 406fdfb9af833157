#include "relay_types.hpp"

namespace websockify {

const char* to_string(Direction d) {
    switch (d) {
        case Direction::ws_to_tcp: return "ws->tcp";
        case Direction::tcp_to_ws: return "tcp->ws";
    }
    return "unknown";
}

const char* to_string(PumpState s) {
    switch (s) {
        case PumpState::idle:      return "idle";
        case PumpState::running:   return "running";
        case PumpState::cancelled: return "cancelled";
        case PumpState::finished:  return "finished";
    }
    return "unknown";
}

const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::negotiating: return "negotiating";
        case SessionState::connecting:  return "connecting";
        case SessionState::forwarding:  return "forwarding";
        case SessionState::draining:    return "draining";
        case SessionState::closed:      return "closed";
    }
    return "unknown";
}

const char* to_string(TerminationCause c) {
    switch (c) {
        case TerminationCause::peer_closed:  return "peer-closed";
        case TerminationCause::local_error:  return "local-error";
        case TerminationCause::remote_error: return "remote-error";
        case TerminationCause::normal_eof:   return "normal-eof";
    }
    return "unknown";
}

bool is_expected_end(const boost::system::error_code& ec) {
    if (!ec) return true;
    if (ec == websocket::error::closed) return true;
    if (ec == net::error::eof) return true;
    if (ec == net::error::operation_aborted) return true;
    if (ec == net::error::bad_descriptor) return true;
    if (ec == net::error::not_connected) return true;
    return false;
}

} // namespace websockify
