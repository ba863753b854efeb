// ═══════════════════════════════════════════════════════════════════
//  transport.cpp — Boost.Beast HTTP/HTTPS client
// ═══════════════════════════════════════════════════════════════════

#include "cypherpp/transport.h"
#include "cypherpp/console.h"
#include "cypherpp/url.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace cypherpp {

namespace beast   = boost::beast;
namespace http_ns = beast::http;
namespace asio    = boost::asio;
namespace ssl     = asio::ssl;
using tcp         = asio::ip::tcp;

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::string HttpResponse::header(const std::string& name) const {
    auto lower = toLower(name);
    auto it = headers.find(lower);
    return it != headers.end() ? it->second : "";
}

TransportError unexpectedResponse(const std::string& operation, const HttpResponse& response) {
    if (response.status == 0) {
        return TransportError(operation + " failed: " + response.statusText);
    }
    return TransportError(operation + " failed: unexpected HTTP status " +
                              std::to_string(response.status) + " " + response.statusText,
                          response.status, response.body);
}

namespace {

http_ns::verb toVerb(Method method) {
    switch (method) {
        case Method::Get:    return http_ns::verb::get;
        case Method::Post:   return http_ns::verb::post;
        case Method::Delete: return http_ns::verb::delete_;
    }
    return http_ns::verb::get;
}

http_ns::request<http_ns::string_body> buildRequest(const TransportOptions& opts,
                                                    const url::Url& target,
                                                    Method method,
                                                    const std::string& body) {
    http_ns::request<http_ns::string_body> req{toVerb(method), target.target, 11};
    req.set(http_ns::field::host, target.host);
    req.set(http_ns::field::user_agent, opts.userAgent);
    req.set(http_ns::field::accept, "application/json; charset=UTF-8");

    for (auto& [key, val] : opts.headers) {
        req.set(key, val);
    }

    // Credentials embedded in the URL take precedence over configured ones
    if (!target.user.empty()) {
        req.set(http_ns::field::authorization, url::basicAuth(target.user, target.password));
    }

    if (method == Method::Post) {
        req.body() = body;
        req.set(http_ns::field::content_type, "application/json");
        req.prepare_payload();
    }
    return req;
}

void readResponse(http_ns::response<http_ns::string_body>& res, HttpResponse& response) {
    response.status = static_cast<int>(res.result_int());
    response.statusText = std::string(res.reason());
    response.body = std::move(res.body());

    for (auto& field : res) {
        response.headers[toLower(std::string(field.name_string()))] = std::string(field.value());
    }
}

HttpResponse sendPlain(const TransportOptions& opts, const url::Url& target,
                       http_ns::request<http_ns::string_body>& req) {
    HttpResponse response;
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.expires_after(std::chrono::milliseconds(opts.timeoutMs));

    auto const results = resolver.resolve(target.host, target.port);
    stream.connect(results);

    http_ns::write(stream, req);

    beast::flat_buffer buffer;
    http_ns::response<http_ns::string_body> res;
    http_ns::read(stream, buffer, res);
    readResponse(res, response);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return response;
}

HttpResponse sendSecure(const TransportOptions& opts, const url::Url& target,
                        http_ns::request<http_ns::string_body>& req) {
    HttpResponse response;
    ssl::context ctx(ssl::context::tls_client);
    if (opts.verifyPeer) {
        if (opts.caFile.empty()) {
            ctx.set_default_verify_paths();
        } else {
            ctx.load_verify_file(opts.caFile);
        }
        ctx.set_verify_mode(ssl::verify_peer);
        ctx.set_verify_callback(ssl::host_name_verification(target.host));
    } else {
        ctx.set_verify_mode(ssl::verify_none);
    }

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI
    if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()};
        throw beast::system_error{ec};
    }

    beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(opts.timeoutMs));
    auto const results = resolver.resolve(target.host, target.port);
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(ssl::stream_base::client);

    http_ns::write(stream, req);

    beast::flat_buffer buffer;
    http_ns::response<http_ns::string_body> res;
    http_ns::read(stream, buffer, res);
    readResponse(res, response);

    // Servers commonly drop the connection without close_notify
    beast::error_code ec;
    stream.shutdown(ec);
    return response;
}

} // namespace

HttpTransport::HttpTransport(TransportOptions options) : options_(std::move(options)) {}

HttpResponse HttpTransport::send(Method method, const std::string& address, const std::string& body) {
    HttpResponse response;
    auto started = std::chrono::steady_clock::now();
    auto target = url::parse(address);

    try {
        auto req = buildRequest(options_, target, method, body);
        response = target.secure() ? sendSecure(options_, target, req)
                                   : sendPlain(options_, target, req);
    } catch (const std::exception& e) {
        response.status = 0;
        response.statusText = e.what();
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    if (response.status == 0) {
        console::warn(toString(method), target.str(), "failed:", response.statusText);
    } else {
        console::debug(toString(method), target.str(), "->", response.status,
                       "(" + std::to_string(elapsed) + "ms)");
    }
    return response;
}

} // namespace cypherpp
