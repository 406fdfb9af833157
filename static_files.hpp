#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace websockify {

// Extracts the target port from "<prefix>{port}" (e.g. "/ws/5555").
// Query strings are ignored. Returns nullopt unless the segment is a
// decimal number in 1..65535 and nothing follows it.
std::optional<std::uint16_t> parse_ws_port(boost::beast::string_view target,
                                           boost::beast::string_view prefix = "/ws/");

// True when target starts with prefix (after stripping the query string).
bool matches_ws_route(boost::beast::string_view target, boost::beast::string_view prefix = "/ws/");

boost::beast::string_view mime_type(boost::beast::string_view path);

// Serves a document root the way a single page app expects: "/" and
// directories resolve to index.html, misses fall back to 404.html.
class StaticFiles {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    enum class Lookup { ok, bad_path, not_found };

    struct Resolved {
        Lookup result = Lookup::not_found;
        std::string path;   // filesystem path when result == ok
    };

    explicit StaticFiles(std::string doc_root);

    // Maps a request target onto the document root.
    Resolved resolve(boost::beast::string_view target) const;

    // Answers req through send(message). send is called exactly once with
    // either a string_body or a file_body response.
    template <class Send>
    void handle(const Request& req, Send&& send) const {
        namespace http = boost::beast::http;

        auto const text = [&req](http::status status, boost::beast::string_view body) {
            http::response<http::string_body> res{status, req.version()};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, "text/plain");
            res.keep_alive(req.keep_alive());
            res.body() = std::string(body);
            res.prepare_payload();
            return res;
        };

        if (req.method() != http::verb::get && req.method() != http::verb::head) {
            auto res = text(http::status::method_not_allowed, "Method Not Allowed");
            res.set(http::field::allow, "GET, HEAD");
            return send(std::move(res));
        }

        auto found = resolve(req.target());
        if (found.result == Lookup::bad_path)
            return send(text(http::status::bad_request, "Bad Request"));

        http::status status = http::status::ok;
        if (found.result == Lookup::not_found) {
            status = http::status::not_found;
            found = resolve("/404.html");
            if (found.result != Lookup::ok)
                return send(text(http::status::not_found, "Not Found"));
        }

        boost::beast::error_code ec;
        http::file_body::value_type body;
        body.open(found.path.c_str(), boost::beast::file_mode::scan, ec);
        if (ec == boost::system::errc::no_such_file_or_directory)
            return send(text(http::status::not_found, "Not Found"));
        if (ec)
            return send(text(http::status::internal_server_error, ec.message()));

        auto const size = body.size();

        if (req.method() == http::verb::head) {
            http::response<http::empty_body> res{status, req.version()};
            res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
            res.set(http::field::content_type, mime_type(found.path));
            res.content_length(size);
            res.keep_alive(req.keep_alive());
            return send(std::move(res));
        }

        http::response<http::file_body> res{
            std::piecewise_construct,
            std::make_tuple(std::move(body)),
            std::make_tuple(status, req.version())};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, mime_type(found.path));
        res.content_length(size);
        res.keep_alive(req.keep_alive());
        return send(std::move(res));
    }

private:
    std::string doc_root_;
};

} // namespace websockify
