#include "static_files.hpp"

#include <boost/beast/core/string.hpp>

#include <cctype>
#include <filesystem>

namespace websockify {

namespace beast = boost::beast;
namespace fs = std::filesystem;

static beast::string_view strip_query(beast::string_view target) {
    auto q = target.find_first_of("?#");
    if (q != beast::string_view::npos) target = target.substr(0, q);
    return target;
}

bool matches_ws_route(beast::string_view target, beast::string_view prefix) {
    target = strip_query(target);
    return target.size() >= prefix.size() && target.substr(0, prefix.size()) == prefix;
}

std::optional<std::uint16_t> parse_ws_port(beast::string_view target, beast::string_view prefix) {
    if (!matches_ws_route(target, prefix)) return std::nullopt;

    auto digits = strip_query(target).substr(prefix.size());
    if (digits.empty() || digits.size() > 5) return std::nullopt;

    unsigned long port = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535) return std::nullopt;
    return static_cast<std::uint16_t>(port);
}

beast::string_view mime_type(beast::string_view path) {
    using beast::iequals;
    auto const ext = [&path] {
        auto const slash = path.rfind('/');
        auto const pos = path.rfind('.');
        if (pos == beast::string_view::npos) return beast::string_view{};
        if (slash != beast::string_view::npos && pos < slash) return beast::string_view{};
        return path.substr(pos);
    }();
    if (iequals(ext, ".htm"))   return "text/html";
    if (iequals(ext, ".html"))  return "text/html";
    if (iequals(ext, ".css"))   return "text/css";
    if (iequals(ext, ".txt"))   return "text/plain";
    if (iequals(ext, ".js"))    return "application/javascript";
    if (iequals(ext, ".mjs"))   return "application/javascript";
    if (iequals(ext, ".json"))  return "application/json";
    if (iequals(ext, ".map"))   return "application/json";
    if (iequals(ext, ".xml"))   return "application/xml";
    if (iequals(ext, ".wasm"))  return "application/wasm";
    if (iequals(ext, ".png"))   return "image/png";
    if (iequals(ext, ".jpe"))   return "image/jpeg";
    if (iequals(ext, ".jpeg"))  return "image/jpeg";
    if (iequals(ext, ".jpg"))   return "image/jpeg";
    if (iequals(ext, ".gif"))   return "image/gif";
    if (iequals(ext, ".ico"))   return "image/vnd.microsoft.icon";
    if (iequals(ext, ".svg"))   return "image/svg+xml";
    if (iequals(ext, ".webp"))  return "image/webp";
    if (iequals(ext, ".woff"))  return "font/woff";
    if (iequals(ext, ".woff2")) return "font/woff2";
    return "application/octet-stream";
}

// Decodes %XX escapes. Returns false on a malformed escape or a NUL byte.
static bool percent_decode(beast::string_view in, std::string& out) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) return false;
            int hi = hex(in[i + 1]), lo = hex(in[i + 2]);
            if (hi < 0 || lo < 0) return false;
            c = static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        if (c == '\0') return false;
        out.push_back(c);
    }
    return true;
}

StaticFiles::StaticFiles(std::string doc_root) : doc_root_(std::move(doc_root)) {
    while (doc_root_.size() > 1 && doc_root_.back() == '/') doc_root_.pop_back();
}

StaticFiles::Resolved StaticFiles::resolve(beast::string_view target) const {
    Resolved out;

    std::string rel;
    target = strip_query(target);
    if (target.empty() || target.front() != '/' || !percent_decode(target, rel)) {
        out.result = Lookup::bad_path;
        return out;
    }

    // Reject any ".." segment outright; no normalisation games.
    std::size_t start = 0;
    while (start <= rel.size()) {
        auto end = rel.find('/', start);
        if (end == std::string::npos) end = rel.size();
        if (rel.compare(start, end - start, "..") == 0 && end - start == 2) {
            out.result = Lookup::bad_path;
            return out;
        }
        start = end + 1;
    }

    std::string path = doc_root_ + rel;
    if (rel.back() == '/') path += "index.html";

    std::error_code ec;
    if (fs::is_directory(path, ec)) path += "/index.html";
    if (!fs::is_regular_file(path, ec)) {
        out.result = Lookup::not_found;
        return out;
    }

    out.result = Lookup::ok;
    out.path = std::move(path);
    return out;
}

} // namespace websockify
