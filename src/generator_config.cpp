#include "generator_config.hpp"
#include "arguments.hpp"
#include "client_generator.hpp"
#include "renderer.hpp"

#include <cctype>
#include <fstream>
#include <stdexcept>

namespace graphql_codegen {

namespace {

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open file");
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("invalid JSON: ") + e.what());
    }
}

template <typename T>
T optionalField(const nlohmann::json& json, const char* key, T fallback) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

std::string requiredString(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::runtime_error(std::string("Missing required string '") + key + "'");
    }
    return it->get<std::string>();
}

std::string lowerFirst(std::string name) {
    if (!name.empty()) {
        name[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
    }
    return name;
}

} // namespace

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

GeneratorConfig parseGeneratorConfig(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("Generator config must be a JSON object");
    }

    GeneratorConfig config;
    config.clientName        = optionalField(json, "clientName", config.clientName);
    config.baseClient        = optionalField(json, "baseClient", config.baseClient);
    config.baseClientInclude = optionalField(json, "baseClientInclude", config.baseClientInclude);
    config.unsetInclude      = optionalField(json, "unsetInclude", config.unsetInclude);
    config.inputTypesModule  = optionalField(json, "inputTypesModule", config.inputTypesModule);
    config.enumsModule       = optionalField(json, "enumsModule", config.enumsModule);
    config.inputsNamespace   = optionalField(json, "inputsNamespace", config.inputsNamespace);
    config.enumsNamespace    = optionalField(json, "enumsNamespace", config.enumsNamespace);
    config.moduleNamespace   = optionalField(json, "namespace", config.moduleNamespace);
    config.async             = optionalField(json, "async", config.async);
    config.inputTypes        = optionalField(json, "inputTypes", config.inputTypes);
    config.enums             = optionalField(json, "enums", config.enums);

    auto scalars = json.find("customScalars");
    if (scalars != json.end() && !scalars->is_null()) {
        if (!scalars->is_object()) {
            throw std::runtime_error("'customScalars' must be an object");
        }
        for (const auto& [graphqlName, entry] : scalars->items()) {
            if (!entry.is_object()) {
                throw std::runtime_error("Custom scalar '" + graphqlName + "' must be an object");
            }
            ScalarData data;
            data.graphqlName = graphqlName;
            data.typeName    = requiredString(entry, "type");
            data.include     = optionalField(entry, "include", std::string());
            data.serialize   = optionalField(entry, "serialize", std::string());
            data.parse       = optionalField(entry, "parse", std::string());
            config.customScalars.emplace(graphqlName, std::move(data));
        }
    }
    return config;
}

std::vector<OperationSpec> parseOperations(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw std::runtime_error("Operations must be a JSON array");
    }

    std::vector<OperationSpec> operations;
    for (const auto& entry : json) {
        if (!entry.is_object()) {
            throw std::runtime_error("Operation entry must be an object");
        }

        OperationSpec spec;
        spec.definition.name      = requiredString(entry, "name");
        spec.definition.operation = requiredString(entry, "operation");
        spec.methodName       = optionalField(entry, "methodName", lowerFirst(spec.definition.name));
        spec.returnType       = optionalField(entry, "returnType", spec.definition.name);
        spec.returnTypeModule = requiredString(entry, "returnTypeModule");

        auto variables = entry.find("variables");
        if (variables != entry.end() && !variables->is_null()) {
            if (!variables->is_array()) {
                throw std::runtime_error("'variables' of " + spec.definition.name + " must be an array");
            }
            for (const auto& variable : *variables) {
                VariableDefinition definition;
                definition.name       = requiredString(variable, "name");
                definition.hasDefault = optionalField(variable, "hasDefault", false);
                try {
                    definition.type = parseTypeRef(requiredString(variable, "type"));
                } catch (const std::invalid_argument& e) {
                    throw std::runtime_error(spec.definition.name + ": " + e.what());
                }
                spec.definition.variableDefinitions.push_back(std::move(definition));
            }
        }
        operations.push_back(std::move(spec));
    }
    return operations;
}

GeneratorConfig loadGeneratorConfig(const std::string& path) {
    try {
        return parseGeneratorConfig(readJsonFile(path));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

std::vector<OperationSpec> loadOperations(const std::string& path) {
    try {
        return parseOperations(readJsonFile(path));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

std::string generateClientSource(const GeneratorConfig& config,
                                 const std::vector<OperationSpec>& operations,
                                 const PluginManager* plugins)
{
    SchemaTypes schema;
    schema.inputTypes      = config.inputTypes;
    schema.enums           = config.enums;
    schema.customScalars   = config.customScalars;
    schema.inputsNamespace = config.inputsNamespace;
    schema.enumsNamespace  = config.enumsNamespace;
    ArgumentsGenerator arguments(std::move(schema));

    ClientGeneratorOptions options;
    options.name                 = config.clientName;
    options.baseClient           = config.baseClient;
    options.enumsModuleName      = config.enumsModule;
    options.inputTypesModuleName = config.inputTypesModule;
    options.customScalars        = config.customScalars;
    options.moduleNamespace      = config.moduleNamespace;
    if (!config.baseClientInclude.empty()) {
        options.baseClientImport = ast::generateImport({config.baseClient}, config.baseClientInclude);
    }
    if (!config.unsetInclude.empty()) {
        options.unsetImport = ast::generateImport({"graphql_codegen::UNSET"}, config.unsetInclude);
    }

    ClientGenerator generator(std::move(options), arguments, plugins);
    for (const auto& operation : operations) {
        generator.addMethod(operation.definition,
                            operation.methodName,
                            operation.returnType,
                            operation.returnTypeModule,
                            operation.definition.operation,
                            config.async);
    }
    return Renderer().renderModule(generator.generate());
}

} // namespace graphql_codegen
