#include "beast_transport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef GRAPHQL_CODEGEN_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace graphql_codegen {

namespace {

http::request<http::string_body> buildRequest(const UrlParts& url,
                                              const HttpRequest& request)
{
    http::request<http::string_body> req{http::verb::post, url.target, 11};
    req.set(http::field::host, url.host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "graphql_codegen/1.0");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.contentType.empty()) {
        req.set(http::field::content_type, request.contentType);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

HttpResponse toResponse(http::response<http::string_body>& res) {
    HttpResponse response;
    response.statusCode = res.result_int();
    for (const auto& field : res) {
        auto name  = field.name_string();
        auto value = field.value();
        response.headers[std::string(name.data(), name.size())] =
            std::string(value.data(), value.size());
    }
    response.body = std::move(res.body());
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastTransport::BeastTransport(int timeoutMs)
    : mTimeoutMs(timeoutMs) {}

BeastTransport::BeastTransport(net::any_io_executor executor, int timeoutMs)
    : mExecutor(std::move(executor))
    , mTimeoutMs(timeoutMs) {}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::post(const HttpRequest& request) {
    auto url = prepare(request);
    auto response = (url.scheme == "https") ? doHttpsRequest(url, request)
                                            : doHttpRequest(url, request);
    if (mVerbose) {
        std::cerr << "[BeastTransport] HTTP " << response.statusCode << "\n";
    }
    return response;
}

HttpResponse BeastTransport::post(const HttpRequest& request,
                                  net::yield_context yield)
{
    if (!mExecutor) {
        throw std::logic_error(
            "BeastTransport: asynchronous post requires an executor");
    }
    auto url = prepare(request);
    auto response = (url.scheme == "https") ? doHttpsRequest(url, request, yield)
                                            : doHttpRequest(url, request, yield);
    if (mVerbose) {
        std::cerr << "[BeastTransport] HTTP " << response.statusCode << " (async)\n";
    }
    return response;
}

void BeastTransport::close() {
    if (!mClosed.exchange(true) && mVerbose) {
        std::cerr << "[BeastTransport] Closed\n";
    }
}

UrlParts BeastTransport::prepare(const HttpRequest& request) const {
    if (mClosed) {
        throw std::logic_error("BeastTransport: post after close()");
    }
    auto url = parseUrl(request.url);

    if (mVerbose) {
        std::cerr << "[BeastTransport] POST " << url.host << ":" << url.port
                  << url.target << "\n"
                  << "[BeastTransport] Body: " << truncateForLog(request.body) << "\n";
    }
    return url;
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpRequest(const UrlParts& url,
                                           const HttpRequest& request)
{
    net::io_context   ioc;
    tcp::resolver     resolver(ioc);
    beast::tcp_stream stream(ioc);

    auto const results = resolver.resolve(url.host, url.port);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(url, request);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    // The response is complete; a failed shutdown does not affect it.
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && mVerbose) {
        std::cerr << "[BeastTransport] Shutdown: " << ec.message() << "\n";
    }

    return toResponse(res);
}

HttpResponse BeastTransport::doHttpRequest(const UrlParts& url,
                                           const HttpRequest& request,
                                           net::yield_context yield)
{
    tcp::resolver     resolver(*mExecutor);
    beast::tcp_stream stream(*mExecutor);

    auto const results = resolver.async_resolve(url.host, url.port, yield);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.async_connect(results, yield);

    auto req = buildRequest(url, request);
    http::async_write(stream, req, yield);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::async_read(stream, buffer, res, yield);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && mVerbose) {
        std::cerr << "[BeastTransport] Shutdown: " << ec.message() << "\n";
    }

    return toResponse(res);
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

HttpResponse BeastTransport::doHttpsRequest(const UrlParts& url,
                                            const HttpRequest& request)
{
#ifdef GRAPHQL_CODEGEN_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(url.host, url.port);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(url, request);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.shutdown(ec);
    if (ec && mVerbose) {
        std::cerr << "[BeastTransport] TLS shutdown: " << ec.message() << "\n";
    }

    return toResponse(res);
#else
    (void)url;
    (void)request;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

HttpResponse BeastTransport::doHttpsRequest(const UrlParts& url,
                                            const HttpRequest& request,
                                            net::yield_context yield)
{
#ifdef GRAPHQL_CODEGEN_HAS_SSL
    namespace ssl = net::ssl;

    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(*mExecutor);
    beast::ssl_stream<beast::tcp_stream> stream(*mExecutor, ctx);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.async_resolve(url.host, url.port, yield);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).async_connect(results, yield);

    stream.async_handshake(ssl::stream_base::client, yield);

    auto req = buildRequest(url, request);
    http::async_write(stream, req, yield);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::async_read(stream, buffer, res, yield);

    beast::error_code ec;
    stream.async_shutdown(yield[ec]);
    if (ec && mVerbose) {
        std::cerr << "[BeastTransport] TLS shutdown: " << ec.message() << "\n";
    }

    return toResponse(res);
#else
    (void)url;
    (void)request;
    (void)yield;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace graphql_codegen
