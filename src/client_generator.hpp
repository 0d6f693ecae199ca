#pragma once

#include "arguments.hpp"
#include "ast.hpp"
#include "graphql_types.hpp"
#include "plugins.hpp"
#include "scalars.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace graphql_codegen {

struct ClientGeneratorOptions {
    std::string                       name       = "Client";
    std::string                       baseClient = "graphql_codegen::BaseClient";
    std::string                       enumsModuleName;
    std::string                       inputTypesModuleName;
    std::optional<ast::Import>        baseClientImport;
    std::optional<ast::Import>        unsetImport;
    std::map<std::string, ScalarData> customScalars;
    std::string                       moduleNamespace;   // empty: global
};

/// Builds the syntax tree of a client class with one method per operation.
///
/// Methods keep the order of addMethod() calls. Every node passes through the
/// matching plugin hook, when a PluginManager is given, before it is used.
class ClientGenerator {
public:
    /// @param arguments  Shared with the caller; records type usage across
    ///                   every addMethod() call.
    /// @param plugins    Optional; not owned.
    ClientGenerator(ClientGeneratorOptions options,
                    ArgumentsGenerator& arguments,
                    const PluginManager* plugins = nullptr);

    /// Appends a method running @p operationStr and parsing the result into
    /// @p returnType. Async methods suspend their coroutine during execute().
    /// @throws std::logic_error after generate().
    void addMethod(const OperationDefinition& definition,
                   const std::string& name,
                   const std::string& returnType,
                   const std::string& returnTypeModule,
                   const std::string& operationStr,
                   bool async = true);

    /// Finishes the module: imports, the gql() helper, then the class.
    /// May be called once.
    ast::Module generate();

    const std::vector<ast::Import>& imports() const { return mImports; }

private:
    ClientGeneratorOptions mOptions;
    ArgumentsGenerator&    mArguments;
    const PluginManager*   mPlugins;

    std::vector<ast::Import> mImports;
    ast::ClassDef            mClassDef;
    bool                     mGenerated = false;

    void addImport(std::optional<ast::Import> import);

    ast::FunctionDef generateMethod(const std::string& name,
                                    const std::string& returnType,
                                    std::vector<ast::Arg> arguments,
                                    ast::ExprPtr argumentsMapping,
                                    const std::string& operationStr,
                                    bool async) const;

    ast::Stmt generateOperationStrAssign(const std::string& operationStr) const;
    ast::Stmt generateVariablesAssign(ast::ExprPtr argumentsMapping) const;
    ast::Stmt generateResponseAssign(bool async) const;
    ast::Stmt generateDataRetrieval() const;
    ast::Stmt generateReturnParsedObj(const std::string& returnType) const;
    ast::FunctionDef generateGqlFunc() const;
};

} // namespace graphql_codegen
