#pragma once

#include <boost/beast/core/string.hpp>

#include <optional>
#include <string>

namespace websockify {

// The only subprotocol we speak.
inline constexpr const char* kBinarySubprotocol = "binary";

// Picks "binary" out of a comma separated Sec-WebSocket-Protocol value.
// Returns nullopt when the client did not offer it.
std::optional<std::string> select_subprotocol(boost::beast::string_view offered);

} // namespace websockify
