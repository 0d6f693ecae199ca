/// @file test_base_client.cpp
/// Unit tests for base_client.hpp against a recording transport: request
/// assembly (JSON and multipart), response classification and ownership.

#include "base_client.hpp"
#include "beast_transport.hpp"
#include "support/recording_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <stdexcept>

using namespace graphql_codegen;
using graphql_codegen::testing::RecordingTransport;
using json = nlohmann::json;

namespace {

const std::string kUrl = "http://localhost:4000/graphql";

HttpResponse makeResponse(unsigned int status, std::string body) {
    HttpResponse response;
    response.statusCode = status;
    response.body = std::move(body);
    return response;
}

/// Body of the multipart part named @p name.
std::string partBody(const std::string& body, const std::string& name) {
    auto header = body.find("name=\"" + name + "\"");
    if (header == std::string::npos) {
        return {};
    }
    auto start = body.find("\r\n\r\n", header) + 4;
    auto end   = body.find("\r\n--", start);
    return body.substr(start, end - start);
}

/// Reports close() to a counter that outlives the transport.
class CountingTransport : public RecordingTransport {
public:
    explicit CountingTransport(int& closes) : mCloses(closes) {}

    void close() override {
        ++mCloses;
        RecordingTransport::close();
    }

private:
    int& mCloses;
};

class BaseClientTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
    BaseClient client{kUrl, {{"Authorization", "Bearer token"}}, transport};
};

} // namespace

// ============================================================================
// execute: plain JSON
// ============================================================================

TEST_F(BaseClientTest, JsonRequestCarriesQueryAndVariables) {
    client.execute("query { a }", {{"id", "1"}, {"n", 2}});

    ASSERT_EQ(transport->requests.size(), 1u);
    const auto& request = transport->requests[0];
    EXPECT_EQ(request.url, kUrl);
    EXPECT_EQ(request.contentType, "application/json");
    EXPECT_EQ(request.headers.at("Authorization"), "Bearer token");
    EXPECT_EQ(json::parse(request.body),
              json({{"query", "query { a }"}, {"variables", {{"id", "1"}, {"n", 2}}}}));
}

TEST_F(BaseClientTest, UnsetVariablesAreOmittedNullsKept) {
    client.execute("query { a }", {{"gone", UNSET}, {"kept", nullptr}});

    auto body = json::parse(transport->requests.at(0).body);
    EXPECT_FALSE(body["variables"].contains("gone"));
    ASSERT_TRUE(body["variables"].contains("kept"));
    EXPECT_TRUE(body["variables"]["kept"].is_null());
}

TEST_F(BaseClientTest, NoVariablesSendsEmptyObject) {
    client.execute("query { a }");
    auto body = json::parse(transport->requests.at(0).body);
    EXPECT_EQ(body["variables"], json::object());
}

TEST_F(BaseClientTest, OnePostPerExecute) {
    client.execute("query { a }");
    client.execute("query { b }");
    EXPECT_EQ(transport->requests.size(), 2u);
}

// ============================================================================
// execute: multipart
// ============================================================================

TEST_F(BaseClientTest, FilesSwitchToMultipart) {
    auto file = Upload::fromBytes("a.txt", "hello", "text/plain");
    client.execute("mutation($file: Upload!) { upload(file: $file) }", {{"file", file}});

    const auto& request = transport->requests.at(0);
    ASSERT_EQ(request.contentType.rfind("multipart/form-data; boundary=", 0), 0u);

    auto operations = json::parse(partBody(request.body, "operations"));
    EXPECT_EQ(operations["variables"], json({{"file", nullptr}}));
    EXPECT_EQ(operations["query"], "mutation($file: Upload!) { upload(file: $file) }");

    EXPECT_EQ(json::parse(partBody(request.body, "map")),
              json({{"0", {"variables.file"}}}));
    EXPECT_NE(request.body.find("name=\"0\"; filename=\"a.txt\"\r\nContent-Type: text/plain"),
              std::string::npos);
    EXPECT_EQ(partBody(request.body, "0"), "hello");
}

TEST_F(BaseClientTest, FileAtTwoPathsListedUnderOneIndex) {
    auto file = Upload::fromBytes("a.bin", "A");
    auto other = Upload::fromBytes("b.bin", "B");
    client.execute("mutation { x }",
                   {{"first", file}, {"list", Value::Sequence{other, file}}});

    const auto& body = transport->requests.at(0).body;
    EXPECT_EQ(json::parse(partBody(body, "map")),
              json({{"0", {"variables.first", "variables.list.1"}},
                    {"1", {"variables.list.0"}}}));
    EXPECT_EQ(partBody(body, "0"), "A");
    EXPECT_EQ(partBody(body, "1"), "B");
}

TEST_F(BaseClientTest, OperationsMapThenFilesOrder) {
    client.execute("mutation { x }", {{"file", Upload::fromBytes("a", "A")}});

    const auto& body = transport->requests.at(0).body;
    auto operations = body.find("name=\"operations\"");
    auto map = body.find("name=\"map\"");
    auto file = body.find("name=\"0\"");
    EXPECT_LT(operations, map);
    EXPECT_LT(map, file);
}

// ============================================================================
// getData
// ============================================================================

TEST_F(BaseClientTest, ReturnsData) {
    auto data = client.getData(makeResponse(200, R"({"data": {"x": 1}})"));
    EXPECT_EQ(data, json({{"x", 1}}));
}

TEST_F(BaseClientTest, NullDataIsReturned) {
    EXPECT_TRUE(client.getData(makeResponse(200, R"({"data": null})")).is_null());
}

TEST_F(BaseClientTest, EmptyOrNullErrorsIgnored) {
    EXPECT_EQ(client.getData(makeResponse(200, R"({"data": {"x": 1}, "errors": []})")),
              json({{"x", 1}}));
    EXPECT_EQ(client.getData(makeResponse(200, R"({"data": {"x": 1}, "errors": null})")),
              json({{"x", 1}}));
}

TEST_F(BaseClientTest, FalsyErrorsIgnored) {
    for (const char* errors : {"false", "0", "\"\"", "{}"}) {
        auto body = std::string(R"({"data": {"x": 1}, "errors": )") + errors + "}";
        EXPECT_EQ(client.getData(makeResponse(200, body)), json({{"x", 1}})) << errors;
    }
}

TEST_F(BaseClientTest, ServerErrorIsHttpErrorWithoutParsing) {
    try {
        client.getData(makeResponse(500, "this is not json"));
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.statusCode(), 500u);
        EXPECT_EQ(e.response().body, "this is not json");
    }
}

TEST_F(BaseClientTest, NonJsonBodyIsInvalidResponse) {
    EXPECT_THROW(client.getData(makeResponse(200, "<html></html>")), InvalidResponseError);
}

TEST_F(BaseClientTest, ArrayBodyIsInvalidResponse) {
    EXPECT_THROW(client.getData(makeResponse(200, "[1, 2]")), InvalidResponseError);
}

TEST_F(BaseClientTest, MissingDataIsInvalidResponse) {
    EXPECT_THROW(client.getData(makeResponse(200, R"({"errors": [{"message": "x"}]})")),
                 InvalidResponseError);
}

TEST_F(BaseClientTest, MalformedErrorsAreInvalidResponse) {
    EXPECT_THROW(client.getData(makeResponse(200, R"({"data": null, "errors": [{"msg": 1}]})")),
                 InvalidResponseError);
    EXPECT_THROW(client.getData(makeResponse(200, R"({"data": null, "errors": "boom"})")),
                 InvalidResponseError);
}

TEST_F(BaseClientTest, GraphQLErrorsCarryPartialData) {
    try {
        client.getData(makeResponse(200, R"({"data": {"x": 1}, "errors": [{"message": "boom"}]})"));
        FAIL() << "expected GraphQLMultiError";
    } catch (const GraphQLMultiError& e) {
        EXPECT_EQ(e.data(), json({{"x", 1}}));
        ASSERT_EQ(e.errors().size(), 1u);
        EXPECT_EQ(e.errors()[0].message(), "boom");
        EXPECT_STREQ(e.what(), "boom");
    }
}

// ============================================================================
// Ownership and the suspending path
// ============================================================================

TEST(BaseClientOwnership, InjectedTransportIsNeverClosed) {
    auto transport = std::make_shared<RecordingTransport>();
    {
        BaseClient client(kUrl, {}, transport);
        client.close();
    }
    EXPECT_EQ(transport->closeCount, 0);
}

TEST(BaseClientOwnership, OwnedTransportRejectsExecuteAfterClose) {
    BaseClient client(kUrl);
    client.close();
    client.close();
    EXPECT_THROW(client.execute("query { a }"), std::logic_error);
}

TEST(BaseClientOwnership, OwnedTransportClosedAtScopeExit) {
    int closes = 0;
    {
        BaseClient client(kUrl, {},
                          std::unique_ptr<HttpTransport>(new CountingTransport(closes)));
        client.getData(client.execute("query { a }"));
    }
    EXPECT_EQ(closes, 1);
}

TEST(BaseClientOwnership, OwnedTransportClosedWhenScopeThrows) {
    int closes = 0;
    auto transport = std::make_unique<CountingTransport>(closes);
    transport->enqueue(200, R"({"data": null, "errors": [{"message": "boom"}]})");
    try {
        BaseClient client(kUrl, {}, std::unique_ptr<HttpTransport>(std::move(transport)));
        client.getData(client.execute("query { a }"));
        FAIL() << "expected GraphQLMultiError";
    } catch (const GraphQLClientError&) {
    }
    EXPECT_EQ(closes, 1);
}

TEST(BaseClientOwnership, ExplicitCloseThenScopeExitClosesOnce) {
    int closes = 0;
    {
        BaseClient client(kUrl, {},
                          std::unique_ptr<HttpTransport>(new CountingTransport(closes)));
        client.close();
        EXPECT_THROW(client.execute("query { a }"), std::logic_error);
    }
    EXPECT_EQ(closes, 1);
}

TEST(BaseClientOwnership, NullOwnedTransportThrows) {
    EXPECT_THROW(BaseClient(kUrl, {}, std::unique_ptr<HttpTransport>()), std::invalid_argument);
}

TEST(BaseClientOwnership, VerboseReachesOwnedTransportOnly) {
    auto owned = new RecordingTransport;
    BaseClient ownedClient(kUrl, {}, std::unique_ptr<HttpTransport>(owned));
    ownedClient.setVerbose(true);
    EXPECT_TRUE(owned->verbose);

    auto shared = std::make_shared<RecordingTransport>();
    BaseClient sharedClient(kUrl, {}, shared);
    sharedClient.setVerbose(true);
    EXPECT_FALSE(shared->verbose);
}

TEST(BeastTransportClose, PostAfterCloseThrows) {
    BeastTransport transport;
    EXPECT_FALSE(transport.isClosed());
    transport.close();
    transport.close();
    EXPECT_TRUE(transport.isClosed());

    HttpRequest request;
    request.url  = kUrl;
    request.body = "{}";
    EXPECT_THROW(transport.post(request), std::logic_error);
}

TEST(BaseClientAsync, SuspendingExecuteUsesAsyncPost) {
    auto transport = std::make_shared<RecordingTransport>();
    transport->enqueue(200, R"({"data": {"ok": true}})");
    BaseClient client(kUrl, {}, transport);

    boost::asio::io_context ioc;
    json data;
    boost::asio::spawn(ioc, [&](boost::asio::yield_context yield) {
        auto response = client.execute("query { ok }", {{"id", 1}}, yield);
        data = client.getData(response);
    });
    ioc.run();

    EXPECT_EQ(transport->asyncPosts, 1);
    EXPECT_EQ(data, json({{"ok", true}}));
    EXPECT_EQ(json::parse(transport->requests.at(0).body)["variables"], json({{"id", 1}}));
}

TEST(BaseClientPrepare, SameRequestForBothPaths) {
    BaseClient client(kUrl, {}, std::make_shared<RecordingTransport>());
    auto request = client.prepareRequest("query { a }", {{"x", 1}});
    EXPECT_EQ(request.url, kUrl);
    EXPECT_EQ(json::parse(request.body)["variables"]["x"], 1);
}
