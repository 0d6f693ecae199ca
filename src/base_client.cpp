#include "base_client.hpp"
#include "beast_transport.hpp"
#include "multipart.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace graphql_codegen {

namespace {

// null, false, 0, "" and empty containers all mean "no errors".
bool isPresent(const nlohmann::json& value) {
    switch (value.type()) {
    case nlohmann::json::value_t::null:
        return false;
    case nlohmann::json::value_t::boolean:
        return value.get<bool>();
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
    case nlohmann::json::value_t::number_float:
        return value.get<double>() != 0.0;
    case nlohmann::json::value_t::string:
        return !value.get_ref<const std::string&>().empty();
    default:
        return !value.empty();
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BaseClient::BaseClient(std::string url,
                       Headers headers,
                       std::shared_ptr<HttpTransport> transport)
    : mUrl(std::move(url))
    , mHeaders(std::move(headers))
    , mTransport(std::move(transport))
{
    if (!mTransport) {
        mTransport     = std::make_shared<BeastTransport>();
        mOwnsTransport = true;
    }
}

BaseClient::BaseClient(std::string url,
                       Headers headers,
                       std::unique_ptr<HttpTransport> transport)
    : mUrl(std::move(url))
    , mHeaders(std::move(headers))
    , mTransport(std::move(transport))
    , mOwnsTransport(true)
{
    if (!mTransport) {
        throw std::invalid_argument("BaseClient: owned transport is null");
    }
}

BaseClient::BaseClient(std::string url,
                       Headers headers,
                       boost::asio::any_io_executor executor)
    : mUrl(std::move(url))
    , mHeaders(std::move(headers))
    , mTransport(std::make_shared<BeastTransport>(std::move(executor)))
    , mOwnsTransport(true) {}

BaseClient::~BaseClient() {
    close();
}

void BaseClient::close() {
    if (mOwnsTransport && mTransport) {
        mTransport->close();
        mTransport.reset();
        if (mVerbose) {
            std::cerr << "[BaseClient] Transport closed\n";
        }
    }
}

void BaseClient::setVerbose(bool v) {
    mVerbose = v;
    if (mOwnsTransport && mTransport) {
        mTransport->setVerbose(v);
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpResponse BaseClient::execute(const std::string& query,
                                 const Variables& variables)
{
    auto request = prepareRequest(query, variables);
    if (!mTransport) {
        throw std::logic_error("BaseClient: execute after close()");
    }
    return mTransport->post(request);
}

HttpResponse BaseClient::execute(const std::string& query,
                                 const Variables& variables,
                                 boost::asio::yield_context yield)
{
    auto request = prepareRequest(query, variables);
    if (!mTransport) {
        throw std::logic_error("BaseClient: execute after close()");
    }
    return mTransport->post(request, yield);
}

nlohmann::json BaseClient::getData(const HttpResponse& response) const {
    if (!response.isSuccess()) {
        throw HttpError(response.statusCode, response);
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        if (mVerbose) {
            std::cerr << "[BaseClient] Failed to parse JSON response: "
                      << e.what() << "\n";
        }
        throw InvalidResponseError(response);
    }

    if (!body.is_object() || !body.contains("data")) {
        throw InvalidResponseError(response);
    }

    nlohmann::json data = body["data"];

    auto errors = body.find("errors");
    if (errors != body.end() && isPresent(*errors)) {
        std::vector<GraphQLError> parsed;
        try {
            parsed = GraphQLMultiError::fromJson(*errors, nullptr).errors();
        } catch (const std::invalid_argument& e) {
            if (mVerbose) {
                std::cerr << "[BaseClient] Malformed errors array: " << e.what() << "\n";
            }
            throw InvalidResponseError(response);
        }
        throw GraphQLMultiError(std::move(parsed), std::move(data));
    }

    return data;
}

// ---------------------------------------------------------------------------
// Request assembly
// ---------------------------------------------------------------------------

HttpRequest BaseClient::prepareRequest(const std::string& query,
                                       const Variables& variables) const
{
    auto extracted = extractFiles(normalizeVariables(variables));

    nlohmann::json payload;
    payload["query"]     = query;
    payload["variables"] = std::move(extracted.variables);

    if (!extracted.files.empty()) {
        return buildMultipartRequest(payload, extracted.files);
    }
    return buildJsonRequest(payload);
}

HttpRequest BaseClient::buildJsonRequest(const nlohmann::json& payload) const {
    HttpRequest request;
    request.url         = mUrl;
    request.headers     = mHeaders;
    request.contentType = "application/json";
    request.body        = payload.dump();

    if (mVerbose) {
        std::cerr << "[BaseClient] JSON request: " << truncateForLog(request.body) << "\n";
    }
    return request;
}

HttpRequest BaseClient::buildMultipartRequest(const nlohmann::json& payload,
                                              const FileReferenceMap& files) const
{
    nlohmann::json map = nlohmann::json::object();
    MultipartFormData form;

    const auto& entries = files.entries();
    for (std::size_t i = 0; i < entries.size(); ++i) {
        map[std::to_string(i)] = entries[i].paths;
    }

    form.addField("operations", payload.dump());
    form.addField("map", map.dump());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& file = entries[i].file;
        form.addFile(std::to_string(i), file.filename(), file.contentType(), file.read());
    }

    if (mVerbose) {
        std::cerr << "[BaseClient] Multipart request with " << entries.size()
                  << " file(s), map: " << map.dump() << "\n";
    }

    HttpRequest request;
    request.url         = mUrl;
    request.headers     = mHeaders;
    request.contentType = form.contentType();
    request.body        = form.body();
    return request;
}

} // namespace graphql_codegen
