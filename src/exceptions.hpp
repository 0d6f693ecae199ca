#pragma once

#include "transport.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace graphql_codegen {

/// Base of every failure surfaced by BaseClient::getData().
class GraphQLClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Transport answered with a non-2xx status. The body is never parsed.
class HttpError : public GraphQLClientError {
public:
    HttpError(unsigned int statusCode, HttpResponse response);

    unsigned int        statusCode() const { return mStatusCode; }
    const HttpResponse& response()   const { return mResponse; }

private:
    unsigned int mStatusCode;
    HttpResponse mResponse;
};

/// Body is not JSON, or not an object with a "data" key.
class InvalidResponseError : public GraphQLClientError {
public:
    explicit InvalidResponseError(HttpResponse response);

    const HttpResponse& response() const { return mResponse; }

private:
    HttpResponse mResponse;
};

struct ErrorLocation {
    int line   = 0;
    int column = 0;
};

using PathSegment = std::variant<std::string, int>;

/// One entry of a response's "errors" array.
class GraphQLError : public GraphQLClientError {
public:
    GraphQLError(std::string message,
                 std::optional<std::vector<ErrorLocation>> locations = std::nullopt,
                 std::optional<std::vector<PathSegment>>   path      = std::nullopt,
                 std::optional<nlohmann::json>             extensions = std::nullopt,
                 nlohmann::json                            original  = nullptr);

    /// @throws std::invalid_argument if @p error lacks a string "message"
    ///         or carries malformed locations / path.
    static GraphQLError fromJson(const nlohmann::json& error);

    const std::string& message() const { return mMessage; }

    const std::optional<std::vector<ErrorLocation>>& locations()  const { return mLocations; }
    const std::optional<std::vector<PathSegment>>&   path()       const { return mPath; }
    const std::optional<nlohmann::json>&             extensions() const { return mExtensions; }
    const nlohmann::json&                            original()   const { return mOriginal; }

private:
    std::string                               mMessage;
    std::optional<std::vector<ErrorLocation>> mLocations;
    std::optional<std::vector<PathSegment>>   mPath;
    std::optional<nlohmann::json>             mExtensions;
    nlohmann::json                            mOriginal;
};

/// All GraphQL errors of one response, with whatever (partial) data came
/// alongside them.
class GraphQLMultiError : public GraphQLClientError {
public:
    GraphQLMultiError(std::vector<GraphQLError> errors, nlohmann::json data);

    /// @throws std::invalid_argument if @p errors is not an array of
    ///         well-formed error objects.
    static GraphQLMultiError fromJson(const nlohmann::json& errors, nlohmann::json data);

    const std::vector<GraphQLError>& errors() const { return mErrors; }
    const nlohmann::json&            data()   const { return mData; }

private:
    std::vector<GraphQLError> mErrors;
    nlohmann::json            mData;
};

} // namespace graphql_codegen
