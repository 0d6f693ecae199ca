#include "exceptions.hpp"

#include <utility>

namespace graphql_codegen {

namespace {

std::string joinMessages(const std::vector<GraphQLError>& errors) {
    std::string joined;
    for (const auto& error : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error.message();
    }
    return joined;
}

} // namespace

HttpError::HttpError(unsigned int statusCode, HttpResponse response)
    : GraphQLClientError("HTTP status code: " + std::to_string(statusCode))
    , mStatusCode(statusCode)
    , mResponse(std::move(response)) {}

InvalidResponseError::InvalidResponseError(HttpResponse response)
    : GraphQLClientError("Invalid response format.")
    , mResponse(std::move(response)) {}

// ---------------------------------------------------------------------------
// GraphQLError
// ---------------------------------------------------------------------------

GraphQLError::GraphQLError(std::string message,
                           std::optional<std::vector<ErrorLocation>> locations,
                           std::optional<std::vector<PathSegment>> path,
                           std::optional<nlohmann::json> extensions,
                           nlohmann::json original)
    : GraphQLClientError(message)
    , mMessage(std::move(message))
    , mLocations(std::move(locations))
    , mPath(std::move(path))
    , mExtensions(std::move(extensions))
    , mOriginal(std::move(original)) {}

GraphQLError GraphQLError::fromJson(const nlohmann::json& error) {
    if (!error.is_object()) {
        throw std::invalid_argument("GraphQL error entry is not an object");
    }
    auto message = error.find("message");
    if (message == error.end() || !message->is_string()) {
        throw std::invalid_argument("GraphQL error entry has no message");
    }

    std::optional<std::vector<ErrorLocation>> locations;
    auto locationsIt = error.find("locations");
    if (locationsIt != error.end() && !locationsIt->is_null()) {
        if (!locationsIt->is_array()) {
            throw std::invalid_argument("GraphQL error locations is not an array");
        }
        locations.emplace();
        for (const auto& location : *locationsIt) {
            if (!location.is_object()
                || !location.contains("line") || !location["line"].is_number_integer()
                || !location.contains("column") || !location["column"].is_number_integer()) {
                throw std::invalid_argument("GraphQL error location is malformed");
            }
            locations->push_back(ErrorLocation{location["line"].get<int>(),
                                               location["column"].get<int>()});
        }
    }

    std::optional<std::vector<PathSegment>> path;
    auto pathIt = error.find("path");
    if (pathIt != error.end() && !pathIt->is_null()) {
        if (!pathIt->is_array()) {
            throw std::invalid_argument("GraphQL error path is not an array");
        }
        path.emplace();
        for (const auto& segment : *pathIt) {
            if (segment.is_string()) {
                path->emplace_back(segment.get<std::string>());
            } else if (segment.is_number_integer()) {
                path->emplace_back(segment.get<int>());
            } else {
                throw std::invalid_argument("GraphQL error path segment is malformed");
            }
        }
    }

    std::optional<nlohmann::json> extensions;
    auto extensionsIt = error.find("extensions");
    if (extensionsIt != error.end() && !extensionsIt->is_null()) {
        extensions = *extensionsIt;
    }

    return GraphQLError(message->get<std::string>(), std::move(locations),
                        std::move(path), std::move(extensions), error);
}

// ---------------------------------------------------------------------------
// GraphQLMultiError
// ---------------------------------------------------------------------------

GraphQLMultiError::GraphQLMultiError(std::vector<GraphQLError> errors, nlohmann::json data)
    : GraphQLClientError(joinMessages(errors))
    , mErrors(std::move(errors))
    , mData(std::move(data)) {}

GraphQLMultiError GraphQLMultiError::fromJson(const nlohmann::json& errors, nlohmann::json data) {
    if (!errors.is_array()) {
        throw std::invalid_argument("GraphQL errors is not an array");
    }
    std::vector<GraphQLError> parsed;
    parsed.reserve(errors.size());
    for (const auto& error : errors) {
        parsed.push_back(GraphQLError::fromJson(error));
    }
    return GraphQLMultiError(std::move(parsed), std::move(data));
}

} // namespace graphql_codegen
