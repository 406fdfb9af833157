#include "subprotocol.hpp"

namespace websockify {

static boost::beast::string_view trim(boost::beast::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::optional<std::string> select_subprotocol(boost::beast::string_view offered) {
    while (!offered.empty()) {
        auto comma = offered.find(',');
        auto candidate = trim(offered.substr(0, comma));
        if (candidate == kBinarySubprotocol) return std::string(kBinarySubprotocol);
        if (comma == boost::beast::string_view::npos) break;
        offered.remove_prefix(comma + 1);
    }
    return std::nullopt;
}

} // namespace websockify
