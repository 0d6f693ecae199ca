/// @file test_generator_config.cpp
/// Unit tests for generator_config.hpp: config and operations files, and the
/// whole generation run on the bundled example.

#include "generator_config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

using namespace graphql_codegen;
using json = nlohmann::json;

namespace {

const std::string kExampleDir = GRAPHQL_CODEGEN_EXAMPLE_DIR;

} // namespace

// ============================================================================
// parseGeneratorConfig
// ============================================================================

TEST(ParseGeneratorConfig, DefaultsForEmptyObject) {
    auto config = parseGeneratorConfig(json::object());
    EXPECT_EQ(config.clientName, "Client");
    EXPECT_EQ(config.baseClient, "graphql_codegen::BaseClient");
    EXPECT_EQ(config.baseClientInclude, "base_client.hpp");
    EXPECT_EQ(config.unsetInclude, "value.hpp");
    EXPECT_TRUE(config.moduleNamespace.empty());
    EXPECT_FALSE(config.async);
    EXPECT_TRUE(config.customScalars.empty());
}

TEST(ParseGeneratorConfig, ReadsEveryKey) {
    auto config = parseGeneratorConfig({
        {"clientName", "Api"},
        {"namespace", "api"},
        {"async", true},
        {"inputTypes", {"A", "B"}},
        {"enums", {"E"}},
        {"inputsNamespace", "api::inputs"},
        {"customScalars", {{"DateTime", {{"type", "api::DateTime"}, {"serialize", "api::toIso"}}}}},
    });

    EXPECT_EQ(config.clientName, "Api");
    EXPECT_EQ(config.moduleNamespace, "api");
    EXPECT_TRUE(config.async);
    EXPECT_EQ(config.inputTypes, (std::set<std::string>{"A", "B"}));
    EXPECT_EQ(config.enums, std::set<std::string>{"E"});
    EXPECT_EQ(config.inputsNamespace, "api::inputs");

    const auto& scalar = config.customScalars.at("DateTime");
    EXPECT_EQ(scalar.graphqlName, "DateTime");
    EXPECT_EQ(scalar.typeName, "api::DateTime");
    EXPECT_EQ(scalar.serialize, "api::toIso");
    EXPECT_TRUE(scalar.include.empty());
}

TEST(ParseGeneratorConfig, MalformedValuesThrow) {
    EXPECT_THROW(parseGeneratorConfig(json::array()), std::runtime_error);
    EXPECT_THROW(parseGeneratorConfig({{"async", "yes"}}), std::runtime_error);
    EXPECT_THROW(parseGeneratorConfig({{"customScalars", {{"X", {{"include", "x.hpp"}}}}}}),
                 std::runtime_error);
}

// ============================================================================
// parseOperations
// ============================================================================

TEST(ParseOperations, ReadsVariablesAndDefaults) {
    auto operations = parseOperations(json::array({
        {
            {"name", "GetUser"},
            {"operation", "query GetUser($ids: [ID!]!) { x }"},
            {"returnTypeModule", "types.hpp"},
            {"variables", json::array({{{"name", "ids"}, {"type", "[ID!]!"}, {"hasDefault", true}}})},
        },
    }));

    ASSERT_EQ(operations.size(), 1u);
    const auto& operation = operations[0];
    EXPECT_EQ(operation.methodName, "getUser");
    EXPECT_EQ(operation.returnType, "GetUser");
    EXPECT_EQ(operation.returnTypeModule, "types.hpp");
    ASSERT_EQ(operation.definition.variableDefinitions.size(), 1u);
    EXPECT_EQ(operation.definition.variableDefinitions[0].type.toString(), "[ID!]!");
    EXPECT_TRUE(operation.definition.variableDefinitions[0].hasDefault);
}

TEST(ParseOperations, MalformedEntriesThrow) {
    EXPECT_THROW(parseOperations(json::object()), std::runtime_error);
    EXPECT_THROW(parseOperations(json::array({{{"name", "A"}}})), std::runtime_error);
    EXPECT_THROW(parseOperations(json::array({{
                     {"name", "A"}, {"operation", "{ a }"}, {"returnTypeModule", "a.hpp"},
                     {"variables", json::array({{{"name", "x"}, {"type", "[Int"}}})},
                 }})),
                 std::runtime_error);
}

// ============================================================================
// Files
// ============================================================================

TEST(LoadFiles, MissingFileNamesThePath) {
    try {
        loadGeneratorConfig("/nonexistent/codegen.json");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("/nonexistent/codegen.json"), std::string::npos);
    }
    EXPECT_THROW(loadOperations("/nonexistent/operations.json"), std::runtime_error);
}

TEST(LoadFiles, ExampleFilesLoad) {
    auto config = loadGeneratorConfig(kExampleDir + "/codegen.json");
    auto operations = loadOperations(kExampleDir + "/operations.json");

    EXPECT_EQ(config.clientName, "ExampleClient");
    ASSERT_EQ(operations.size(), 4u);
    EXPECT_EQ(operations[0].methodName, "getUser");
    EXPECT_EQ(operations[3].methodName, "logVisits");
}

// ============================================================================
// generateClientSource
// ============================================================================

TEST(GenerateClientSource, ExampleClient) {
    auto config = loadGeneratorConfig(kExampleDir + "/codegen.json");
    auto source = generateClientSource(config, loadOperations(kExampleDir + "/operations.json"));

    EXPECT_NE(source.find("#include \"example_types.hpp\"\n"), std::string::npos);
    EXPECT_EQ(source.find("#include \"example_types.hpp\""),
              source.rfind("#include \"example_types.hpp\""));
    EXPECT_NE(source.find("namespace example_client {"), std::string::npos);
    EXPECT_NE(source.find("class ExampleClient : public graphql_codegen::BaseClient"),
              std::string::npos);
    EXPECT_NE(source.find("example::GetUser getUser(const std::string& id)\n"), std::string::npos);
    EXPECT_NE(source.find(
                  "example::SearchUsers searchUsers("
                  "const graphql_codegen::Optional<example::inputs::UserFilter>& filter = graphql_codegen::UNSET, "
                  "const graphql_codegen::Optional<example::Status>& status = graphql_codegen::UNSET, "
                  "const graphql_codegen::Optional<int>& first = graphql_codegen::UNSET, "
                  "const graphql_codegen::Optional<std::string>& after = graphql_codegen::UNSET)\n"),
              std::string::npos);
    EXPECT_NE(source.find(
                  "example::LogVisits logVisits(const example::DateTime& at, int count, "
                  "const graphql_codegen::Optional<std::vector<example::DateTime>>& history = graphql_codegen::UNSET)\n"),
              std::string::npos);
    EXPECT_NE(source.find("{\"at\", example::serializeDateTime(at)},"), std::string::npos);
    EXPECT_NE(source.find("{\"history\", graphql_codegen::Value::serialized(history, example::serializeDateTime)},"),
              std::string::npos);
    EXPECT_EQ(source.find("yield"), std::string::npos);
}

TEST(GenerateClientSource, AsyncFlagMakesCoroutineMethods) {
    auto config = loadGeneratorConfig(kExampleDir + "/codegen.json");
    config.async = true;
    auto source = generateClientSource(config, loadOperations(kExampleDir + "/operations.json"));

    EXPECT_NE(source.find("example::GetUser getUser(boost::asio::yield_context yield, const std::string& id)\n"),
              std::string::npos);
    EXPECT_NE(source.find("/*variables=*/variables, yield);"), std::string::npos);
}

TEST(GenerateClientSource, NoIncludesWhenDisabled) {
    GeneratorConfig config;
    config.baseClientInclude.clear();
    config.unsetInclude.clear();

    OperationSpec ping;
    ping.definition.name      = "Ping";
    ping.definition.operation = "query Ping { ping }";
    ping.methodName           = "ping";
    ping.returnType           = "Ping";
    ping.returnTypeModule     = "ping.hpp";

    auto source = generateClientSource(config, {ping});
    EXPECT_EQ(source.find("base_client.hpp"), std::string::npos);
    EXPECT_EQ(source.find("value.hpp"), std::string::npos);
    EXPECT_NE(source.find("#include \"ping.hpp\""), std::string::npos);
}
