#pragma once

#include <boost/asio/spawn.hpp>

#include <map>
#include <string>

namespace graphql_codegen {

struct HttpRequest {
    std::string                        url;
    std::map<std::string, std::string> headers;
    std::string                        contentType;
    std::string                        body;
};

struct HttpResponse {
    unsigned int                       statusCode = 0;
    std::map<std::string, std::string> headers;
    std::string                        body;

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

/// Sends one POST per call. The blocking overload holds the calling thread;
/// the yield_context overload suspends the calling coroutine instead.
/// Thread-safety is up to the implementation.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse post(const HttpRequest& request) = 0;

    virtual HttpResponse post(const HttpRequest& request,
                              boost::asio::yield_context yield) = 0;

    /// Releases the transport. Later posts throw std::logic_error.
    virtual void close() = 0;

    /// Diagnostics on stderr. Ignored unless the implementation logs.
    virtual void setVerbose(bool) {}
};

} // namespace graphql_codegen
