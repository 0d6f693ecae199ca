#pragma once

#include "graphql_types.hpp"
#include "plugins.hpp"
#include "scalars.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace graphql_codegen {

/// Settings of one generation run, usually read from a JSON file.
struct GeneratorConfig {
    std::string clientName        = "Client";
    std::string baseClient        = "graphql_codegen::BaseClient";
    std::string baseClientInclude = "base_client.hpp";
    std::string unsetInclude      = "value.hpp";
    std::string inputTypesModule;
    std::string enumsModule;
    std::string inputsNamespace;
    std::string enumsNamespace;
    std::string moduleNamespace;
    bool        async = false;

    std::set<std::string>             inputTypes;
    std::set<std::string>             enums;
    std::map<std::string, ScalarData> customScalars;
};

/// One operation as handed over by the GraphQL parser, plus where its
/// result type lives.
struct OperationSpec {
    OperationDefinition definition;
    std::string         methodName;
    std::string         returnType;
    std::string         returnTypeModule;
};

/// @throws std::runtime_error naming the offending key on malformed input.
GeneratorConfig parseGeneratorConfig(const nlohmann::json& json);
std::vector<OperationSpec> parseOperations(const nlohmann::json& json);

/// @throws std::runtime_error naming @p path if it cannot be read or parsed.
GeneratorConfig loadGeneratorConfig(const std::string& path);
std::vector<OperationSpec> loadOperations(const std::string& path);

/// Runs the whole generation and renders the client header.
std::string generateClientSource(const GeneratorConfig& config,
                                 const std::vector<OperationSpec>& operations,
                                 const PluginManager* plugins = nullptr);

} // namespace graphql_codegen
