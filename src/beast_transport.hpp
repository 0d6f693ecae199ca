#pragma once

#include "transport.hpp"
#include "util.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <optional>
#include <string>

namespace graphql_codegen {

/// HTTP(S) transport built on Boost.Beast.
/// Each post opens a connection, sends the request and reads the response.
class BeastTransport : public HttpTransport {
public:
    /// Blocking use only.
    explicit BeastTransport(int timeoutMs = 5000);

    /// @param executor  Runs the suspending overload of post().
    explicit BeastTransport(boost::asio::any_io_executor executor,
                            int timeoutMs = 5000);

    /// @throws std::runtime_error on network / timeout errors.
    HttpResponse post(const HttpRequest& request) override;

    /// @throws std::logic_error if constructed without an executor.
    HttpResponse post(const HttpRequest& request,
                      boost::asio::yield_context yield) override;

    void close() override;

    bool isClosed() const { return mClosed; }

    void setVerbose(bool v) override { mVerbose = v; }

private:
    std::optional<boost::asio::any_io_executor> mExecutor;
    int               mTimeoutMs;
    bool              mVerbose = false;
    std::atomic<bool> mClosed{false};

    UrlParts prepare(const HttpRequest& request) const;

    HttpResponse doHttpRequest(const UrlParts& url, const HttpRequest& request);
    HttpResponse doHttpsRequest(const UrlParts& url, const HttpRequest& request);
    HttpResponse doHttpRequest(const UrlParts& url, const HttpRequest& request,
                               boost::asio::yield_context yield);
    HttpResponse doHttpsRequest(const UrlParts& url, const HttpRequest& request,
                                boost::asio::yield_context yield);
};

} // namespace graphql_codegen
