#include "client_generator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace graphql_codegen {

namespace {

constexpr const char* kGqlFuncName           = "gql";
constexpr const char* kOperationStrVariable  = "query";
constexpr const char* kVariablesDictVariable = "variables";
constexpr const char* kResponseVariable      = "response";
constexpr const char* kDataVariable          = "data";

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line + "\n");
        start = end + 1;
    }
    return lines;
}

void mergeNames(std::vector<std::string>& into, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (std::find(into.begin(), into.end(), name) == into.end()) {
            into.push_back(name);
        }
    }
}

} // namespace

ClientGenerator::ClientGenerator(ClientGeneratorOptions options,
                                 ArgumentsGenerator& arguments,
                                 const PluginManager* plugins)
    : mOptions(std::move(options))
    , mArguments(arguments)
    , mPlugins(plugins)
    , mClassDef(ast::generateClassDef(mOptions.name, {mOptions.baseClient}))
{
    addImport(ast::generateImport({"std::map"}, "map", true));
    addImport(ast::generateImport({"std::string"}, "string", true));
    addImport(ast::generateImport({"std::vector"}, "vector", true));
    addImport(mOptions.baseClientImport);
    addImport(mOptions.unsetImport);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

void ClientGenerator::addMethod(const OperationDefinition& definition,
                                const std::string& name,
                                const std::string& returnType,
                                const std::string& returnTypeModule,
                                const std::string& operationStr,
                                bool async)
{
    if (mGenerated) {
        throw std::logic_error("ClientGenerator: addMethod() after generate()");
    }

    auto generated = mArguments.generate(definition.variableDefinitions);
    auto method = generateMethod(name, returnType, std::move(generated.arguments),
                                 std::move(generated.mapping), operationStr, async);
    if (mPlugins) {
        method = mPlugins->generateClientMethod(std::move(method));
    }
    mClassDef.body.push_back(std::move(method));
    addImport(ast::generateImport({returnType}, returnTypeModule));
}

ast::Module ClientGenerator::generate() {
    if (mGenerated) {
        throw std::logic_error("ClientGenerator: generate() called twice");
    }
    mGenerated = true;

    addImport(ast::generateImport(mArguments.getUsedInputs(), mOptions.inputTypesModuleName));
    addImport(ast::generateImport(mArguments.getUsedEnums(), mOptions.enumsModuleName));
    for (const auto& scalarName : mArguments.getUsedCustomScalars()) {
        auto scalar = mOptions.customScalars.find(scalarName);
        if (scalar == mOptions.customScalars.end()) {
            throw std::invalid_argument("No import data for custom scalar '" + scalarName + "'");
        }
        for (auto& import : generateScalarImports(scalar->second)) {
            addImport(std::move(import));
        }
    }

    auto gqlFunc = generateGqlFunc();
    if (mPlugins) {
        gqlFunc = mPlugins->generateGqlFunction(std::move(gqlFunc));
    }

    auto classDef = std::move(mClassDef);
    if (mPlugins) {
        classDef = mPlugins->generateClientClass(std::move(classDef));
    }

    std::vector<ast::TopLevel> body(mImports.begin(), mImports.end());
    body.emplace_back(std::move(gqlFunc));
    body.emplace_back(std::move(classDef));

    auto module = ast::generateModule(std::move(body), mOptions.moduleNamespace);
    if (mPlugins) {
        module = mPlugins->generateClientModule(std::move(module));
    }
    return module;
}

// ---------------------------------------------------------------------------
// Imports
// ---------------------------------------------------------------------------

void ClientGenerator::addImport(std::optional<ast::Import> import) {
    if (!import) {
        return;
    }
    if (mPlugins) {
        import = mPlugins->generateClientImport(std::move(*import));
    }
    if (import->names.empty() || import->module.empty()) {
        return;
    }

    for (auto& existing : mImports) {
        if (existing.module == import->module && existing.system == import->system) {
            mergeNames(existing.names, import->names);
            return;
        }
    }
    mImports.push_back(std::move(*import));
}

// ---------------------------------------------------------------------------
// Method construction
// ---------------------------------------------------------------------------

ast::FunctionDef ClientGenerator::generateMethod(const std::string& name,
                                                 const std::string& returnType,
                                                 std::vector<ast::Arg> arguments,
                                                 ast::ExprPtr argumentsMapping,
                                                 const std::string& operationStr,
                                                 bool async) const
{
    std::vector<ast::Stmt> body{
        generateOperationStrAssign(operationStr),
        generateVariablesAssign(std::move(argumentsMapping)),
        generateResponseAssign(async),
        generateDataRetrieval(),
        generateReturnParsedObj(returnType),
    };
    if (async) {
        return ast::generateAsyncMethodDefinition(name, std::move(arguments), returnType,
                                                  std::move(body));
    }
    return ast::generateMethodDefinition(name, std::move(arguments), returnType,
                                         std::move(body));
}

ast::Stmt ClientGenerator::generateOperationStrAssign(const std::string& operationStr) const {
    return ast::generateAssign(
        kOperationStrVariable,
        ast::generateCall(ast::generateName(kGqlFuncName),
                          {ast::generateStringBlock(splitLines(operationStr))}));
}

ast::Stmt ClientGenerator::generateVariablesAssign(ast::ExprPtr argumentsMapping) const {
    return ast::generateAnnAssign(
        kVariablesDictVariable,
        ast::generateTemplateType("std::map", {"std::string", "graphql_codegen::Value"}),
        std::move(argumentsMapping));
}

ast::Stmt ClientGenerator::generateResponseAssign(bool async) const {
    auto call = ast::generateCall(
        ast::generateAttribute(ast::generateName("this"), "execute", ast::Access::Pointer),
        {},
        {ast::generateKeyword("query", ast::generateName(kOperationStrVariable)),
         ast::generateKeyword("variables", ast::generateName(kVariablesDictVariable))});
    return ast::generateAssign(kResponseVariable, async ? ast::generateAwait(call) : call);
}

ast::Stmt ClientGenerator::generateDataRetrieval() const {
    return ast::generateAssign(
        kDataVariable,
        ast::generateCall(
            ast::generateAttribute(ast::generateName("this"), "getData", ast::Access::Pointer),
            {ast::generateName(kResponseVariable)}));
}

ast::Stmt ClientGenerator::generateReturnParsedObj(const std::string& returnType) const {
    return ast::generateReturn(ast::generateCall(
        ast::generateAttribute(ast::generateName(returnType), "parse", ast::Access::Scope),
        {ast::generateName(kDataVariable)}));
}

ast::FunctionDef ClientGenerator::generateGqlFunc() const {
    const std::string arg = "q";
    return ast::generateMethodDefinition(
        kGqlFuncName,
        {ast::generateArg(arg, "std::string", nullptr, true)},
        "std::string",
        {ast::generateReturn(ast::generateName(arg))});
}

} // namespace graphql_codegen
