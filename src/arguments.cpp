#include "arguments.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace graphql_codegen {

namespace {

const std::set<std::string> kReservedNames = {
    // Locals and parameters of generated methods.
    "query", "variables", "response", "data", "yield", "gql",
    // C++ keywords.
    "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor",
    "bool", "break", "case", "catch", "char", "char8_t", "char16_t", "char32_t",
    "class", "compl", "concept", "const", "consteval", "constexpr", "constinit",
    "const_cast", "continue", "co_await", "co_return", "co_yield", "decltype",
    "default", "delete", "do", "double", "dynamic_cast", "else", "enum",
    "explicit", "export", "extern", "false", "float", "for", "friend", "goto",
    "if", "inline", "int", "long", "mutable", "namespace", "new", "noexcept",
    "not", "not_eq", "nullptr", "operator", "or", "or_eq", "private",
    "protected", "public", "register", "reinterpret_cast", "requires", "return",
    "short", "signed", "sizeof", "static", "static_assert", "static_cast",
    "struct", "switch", "template", "this", "thread_local", "throw", "true",
    "try", "typedef", "typeid", "typename", "union", "unsigned", "using",
    "virtual", "void", "volatile", "wchar_t", "while", "xor", "xor_eq",
};

const std::map<std::string, std::string> kBuiltinScalars = {
    {"Int",     "int"},
    {"Float",   "double"},
    {"String",  "std::string"},
    {"ID",      "std::string"},
    {"Boolean", "bool"},
    {"Upload",  "graphql_codegen::Upload"},
};

constexpr const char* kOptionalType = "graphql_codegen::Optional";
constexpr const char* kValueType    = "graphql_codegen::Value";
constexpr const char* kUnsetName    = "graphql_codegen::UNSET";

std::string qualify(const std::string& nameSpace, const std::string& name) {
    return nameSpace.empty() ? name : nameSpace + "::" + name;
}

void addUnique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

bool passedByValue(const std::string& annotation) {
    return annotation == "int" || annotation == "double" || annotation == "bool";
}

} // namespace

ArgumentsGenerator::ArgumentsGenerator(SchemaTypes schema)
    : mSchema(std::move(schema)) {}

std::string ArgumentsGenerator::parameterName(const std::string& variableName) {
    if (kReservedNames.count(variableName)) {
        return variableName + "_";
    }
    return variableName;
}

// ---------------------------------------------------------------------------
// Type mapping
// ---------------------------------------------------------------------------

std::string ArgumentsGenerator::cppType(const GraphQLType& type) const {
    if (type.isNonNull()) {
        return cppNonNullType(*type.ofType);
    }
    return ast::generateTemplateType(kOptionalType, {cppNonNullType(type)});
}

std::string ArgumentsGenerator::cppNonNullType(const GraphQLType& type) const {
    switch (type.kind) {
    case GraphQLType::Kind::List:
        return ast::generateTemplateType("std::vector", {cppType(*type.ofType)});
    case GraphQLType::Kind::NonNull:
        return cppNonNullType(*type.ofType);
    case GraphQLType::Kind::Named:
        break;
    }
    return cppNamedType(type.name);
}

std::string ArgumentsGenerator::cppNamedType(const std::string& name) const {
    auto builtin = kBuiltinScalars.find(name);
    if (builtin != kBuiltinScalars.end()) {
        return builtin->second;
    }
    if (mSchema.inputTypes.count(name)) {
        return qualify(mSchema.inputsNamespace, name);
    }
    if (mSchema.enums.count(name)) {
        return qualify(mSchema.enumsNamespace, name);
    }
    auto scalar = mSchema.customScalars.find(name);
    if (scalar != mSchema.customScalars.end() && !scalar->second.typeName.empty()) {
        return scalar->second.typeName;
    }
    // Scalars without a configured mapping travel as raw values.
    return kValueType;
}

void ArgumentsGenerator::recordUsage(const std::string& namedType) {
    if (kBuiltinScalars.count(namedType)) {
        return;
    }
    if (mSchema.inputTypes.count(namedType)) {
        addUnique(mUsedInputs, namedType);
    } else if (mSchema.enums.count(namedType)) {
        addUnique(mUsedEnums, namedType);
    } else if (mSchema.customScalars.count(namedType)) {
        addUnique(mUsedCustomScalars, namedType);
    }
}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

ast::ExprPtr ArgumentsGenerator::generateValue(const VariableDefinition& variable,
                                               const std::string& parameter) const
{
    const auto& named = variable.type.namedType();
    auto scalar = mSchema.customScalars.find(named.name);
    if (scalar == mSchema.customScalars.end() || scalar->second.serialize.empty()) {
        return ast::generateName(parameter);
    }

    const auto& serialize = scalar->second.serialize;
    bool bare = variable.type.isNonNull()
             && variable.type.ofType->kind == GraphQLType::Kind::Named
             && !variable.hasDefault;
    if (bare) {
        return ast::generateCall(ast::generateName(serialize), {ast::generateName(parameter)});
    }
    return ast::generateCall(
        ast::generateAttribute(ast::generateName(kValueType), "serialized", ast::Access::Scope),
        {ast::generateName(parameter), ast::generateName(serialize)});
}

GeneratedArguments ArgumentsGenerator::generate(const std::vector<VariableDefinition>& variables) {
    std::vector<ast::Arg> required;
    std::vector<ast::Arg> defaulted;
    std::vector<std::pair<ast::ExprPtr, ast::ExprPtr>> entries;
    std::set<std::string> taken;

    for (const auto& variable : variables) {
        if (variable.name.empty()) {
            throw std::invalid_argument("Variable definition without a name");
        }
        // "data" and "data_" must not both end up as data_.
        auto parameter = parameterName(variable.name);
        while (!taken.insert(parameter).second) {
            parameter += '_';
        }
        recordUsage(variable.type.namedType().name);

        if (variable.type.isNonNull() && !variable.hasDefault) {
            auto annotation = cppNonNullType(*variable.type.ofType);
            bool byValue = passedByValue(annotation);
            required.push_back(ast::generateArg(parameter, std::move(annotation), nullptr, !byValue));
        } else {
            const auto& inner = variable.type.isNonNull() ? *variable.type.ofType : variable.type;
            auto annotation = ast::generateTemplateType(kOptionalType, {cppNonNullType(inner)});
            defaulted.push_back(ast::generateArg(parameter, std::move(annotation),
                                                 ast::generateName(kUnsetName), true));
        }

        entries.emplace_back(ast::generateConstant(variable.name),
                             generateValue(variable, parameter));
    }

    GeneratedArguments generated;
    generated.arguments = std::move(required);
    generated.arguments.insert(generated.arguments.end(),
                               std::make_move_iterator(defaulted.begin()),
                               std::make_move_iterator(defaulted.end()));
    generated.mapping = ast::generateMapLiteral(std::move(entries));
    return generated;
}

} // namespace graphql_codegen
