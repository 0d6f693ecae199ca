#pragma once

#include "ast.hpp"
#include "graphql_types.hpp"
#include "scalars.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace graphql_codegen {

/// What the schema declares, as far as argument typing needs it.
struct SchemaTypes {
    std::set<std::string>             inputTypes;
    std::set<std::string>             enums;
    std::map<std::string, ScalarData> customScalars;
    std::string                       inputsNamespace;   // qualifies input types
    std::string                       enumsNamespace;    // qualifies enums
};

struct GeneratedArguments {
    std::vector<ast::Arg> arguments;   // required first, then defaulted
    ast::ExprPtr          mapping;     // {"name", value} per variable, declaration order
};

/// Turns operation variables into method parameters and the variables
/// mapping, remembering which input types, enums and custom scalars were used.
class ArgumentsGenerator {
public:
    explicit ArgumentsGenerator(SchemaTypes schema);

    GeneratedArguments generate(const std::vector<VariableDefinition>& variables);

    const std::vector<std::string>& getUsedInputs()        const { return mUsedInputs; }
    const std::vector<std::string>& getUsedEnums()         const { return mUsedEnums; }
    const std::vector<std::string>& getUsedCustomScalars() const { return mUsedCustomScalars; }

    /// C++ spelling of @p type; nullable types become Optional<...>.
    std::string cppType(const GraphQLType& type) const;

    /// Parameter name for a variable, suffixed with '_' when it would clash
    /// with a C++ keyword or a local of the generated method.
    static std::string parameterName(const std::string& variableName);

private:
    SchemaTypes              mSchema;
    std::vector<std::string> mUsedInputs;
    std::vector<std::string> mUsedEnums;
    std::vector<std::string> mUsedCustomScalars;

    std::string cppNonNullType(const GraphQLType& type) const;
    std::string cppNamedType(const std::string& name) const;
    void        recordUsage(const std::string& namedType);
    ast::ExprPtr generateValue(const VariableDefinition& variable,
                               const std::string& parameter) const;
};

} // namespace graphql_codegen
