#pragma once

#include "exceptions.hpp"
#include "transport.hpp"
#include "value.hpp"
#include "variables.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/spawn.hpp>
#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>

namespace graphql_codegen {

/// Base class of generated clients: runs an operation over HTTP and turns
/// the response into data or one of the GraphQLClientError types.
///
/// A client that creates its own transport owns it and closes it when
/// destroyed; an injected transport is shared and never closed here.
class BaseClient {
public:
    using Headers = std::map<std::string, std::string>;

    /// @param transport  nullptr creates an owned blocking BeastTransport.
    explicit BaseClient(std::string url,
                        Headers headers = {},
                        std::shared_ptr<HttpTransport> transport = nullptr);

    /// Takes ownership of @p transport: it is closed by close() and by the
    /// destructor, like a transport the client created itself.
    BaseClient(std::string url,
               Headers headers,
               std::unique_ptr<HttpTransport> transport);

    /// Owned BeastTransport bound to @p executor, so the suspending
    /// execute() overload works.
    BaseClient(std::string url,
               Headers headers,
               boost::asio::any_io_executor executor);

    virtual ~BaseClient();

    BaseClient(const BaseClient&)            = delete;
    BaseClient& operator=(const BaseClient&) = delete;

    /// Closes an owned transport. Safe to call more than once.
    void close();

    /// Sends the operation as JSON, or as a multipart request when the
    /// variables hold uploads. Returns the raw response for getData().
    HttpResponse execute(const std::string& query,
                         const Variables& variables = {});

    /// Same request, suspending the calling coroutine during I/O.
    HttpResponse execute(const std::string& query,
                         const Variables& variables,
                         boost::asio::yield_context yield);

    /// @throws HttpError             status is not 2xx
    /// @throws InvalidResponseError  body is not an object with "data"
    /// @throws GraphQLMultiError     response carries a non-empty "errors"
    nlohmann::json getData(const HttpResponse& response) const;

    const std::string& url()     const { return mUrl; }
    const Headers&     headers() const { return mHeaders; }

    /// Also switches the diagnostics of an owned transport.
    void setVerbose(bool v);

    /// Builds the POST for an operation without sending it.
    HttpRequest prepareRequest(const std::string& query,
                               const Variables& variables) const;

private:
    std::string                    mUrl;
    Headers                        mHeaders;
    std::shared_ptr<HttpTransport> mTransport;
    bool                           mOwnsTransport = false;
    bool                           mVerbose       = false;

    HttpRequest buildJsonRequest(const nlohmann::json& payload) const;
    HttpRequest buildMultipartRequest(const nlohmann::json& payload,
                                      const FileReferenceMap& files) const;
};

} // namespace graphql_codegen
