#include "ast.hpp"

#include <cctype>
#include <stdexcept>

namespace graphql_codegen::ast {

namespace {

void requireIdentifier(const std::string& id, bool allowQualified, const char* what) {
    if (!isValidIdentifier(id, allowQualified)) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": '" + id + "'");
    }
}

void requireNode(const ExprPtr& expr, const char* what) {
    if (!expr) {
        throw std::invalid_argument(std::string("Missing expression: ") + what);
    }
}

ExprPtr makeExpr(decltype(Expr::node) node) {
    return std::make_shared<const Expr>(Expr{std::move(node)});
}

} // namespace

bool isValidIdentifier(const std::string& id, bool allowQualified) {
    if (id.empty()) {
        return false;
    }

    std::size_t start = 0;
    if (allowQualified && id.compare(0, 2, "::") == 0) {
        start = 2;
    }
    bool segmentStart = true;
    for (std::size_t i = start; i < id.size(); ++i) {
        auto c = static_cast<unsigned char>(id[i]);
        if (allowQualified && c == ':') {
            if (segmentStart || i + 1 >= id.size() || id[i + 1] != ':') {
                return false;
            }
            ++i;
            segmentStart = true;
            continue;
        }
        if (segmentStart ? !(std::isalpha(c) || c == '_') : !(std::isalnum(c) || c == '_')) {
            return false;
        }
        segmentStart = false;
    }
    return !segmentStart;
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

ExprPtr generateName(const std::string& id) {
    requireIdentifier(id, true, "name");
    return makeExpr(Name{id});
}

ExprPtr generateConstant(std::nullptr_t) { return makeExpr(Constant{nullptr}); }
ExprPtr generateConstant(bool value) { return makeExpr(Constant{value}); }
ExprPtr generateConstant(std::int64_t value) { return makeExpr(Constant{value}); }
ExprPtr generateConstant(double value) { return makeExpr(Constant{value}); }
ExprPtr generateConstant(std::string value) { return makeExpr(Constant{std::move(value)}); }
ExprPtr generateConstant(const char* value) { return generateConstant(std::string(value)); }

ExprPtr generateStringBlock(std::vector<std::string> lines) {
    return makeExpr(StringBlock{std::move(lines)});
}

ExprPtr generateAttribute(ExprPtr value, const std::string& attr, Access access) {
    requireNode(value, "attribute owner");
    requireIdentifier(attr, false, "attribute");
    return makeExpr(Attribute{std::move(value), attr, access});
}

Keyword generateKeyword(const std::string& arg, ExprPtr value) {
    requireIdentifier(arg, false, "keyword");
    requireNode(value, "keyword value");
    return Keyword{arg, std::move(value)};
}

ExprPtr generateCall(ExprPtr func, std::vector<ExprPtr> args, std::vector<Keyword> keywords) {
    requireNode(func, "callee");
    for (const auto& arg : args) {
        requireNode(arg, "call argument");
    }
    return makeExpr(Call{std::move(func), std::move(args), std::move(keywords)});
}

ExprPtr generateAwait(ExprPtr call) {
    requireNode(call, "awaited call");
    if (!std::holds_alternative<Call>(call->node)) {
        throw std::invalid_argument("Only a call can be awaited");
    }
    return makeExpr(Await{std::move(call)});
}

ExprPtr generateMapLiteral(std::vector<std::pair<ExprPtr, ExprPtr>> entries) {
    for (const auto& [key, value] : entries) {
        requireNode(key, "map key");
        requireNode(value, "map value");
    }
    return makeExpr(MapLiteral{std::move(entries)});
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

Stmt generateAssign(const std::string& target, ExprPtr value) {
    requireIdentifier(target, false, "assignment target");
    requireNode(value, "assigned value");
    return Assign{target, std::move(value)};
}

Stmt generateAnnAssign(const std::string& target, std::string annotation, ExprPtr value) {
    requireIdentifier(target, false, "assignment target");
    if (annotation.empty()) {
        throw std::invalid_argument("Missing annotation for '" + target + "'");
    }
    requireNode(value, "assigned value");
    return AnnAssign{target, std::move(annotation), std::move(value)};
}

Stmt generateReturn(ExprPtr value) {
    requireNode(value, "returned value");
    return Return{std::move(value)};
}

// ---------------------------------------------------------------------------
// Definitions
// ---------------------------------------------------------------------------

Arg generateArg(const std::string& name, std::string annotation,
                ExprPtr defaultValue, bool byReference)
{
    requireIdentifier(name, false, "argument name");
    if (annotation.empty()) {
        throw std::invalid_argument("Missing annotation for argument '" + name + "'");
    }
    return Arg{name, std::move(annotation), std::move(defaultValue), byReference};
}

FunctionDef generateMethodDefinition(const std::string& name,
                                     std::vector<Arg> args,
                                     std::string returnType,
                                     std::vector<Stmt> body)
{
    requireIdentifier(name, false, "function name");
    if (returnType.empty()) {
        throw std::invalid_argument("Missing return type for '" + name + "'");
    }
    return FunctionDef{name, std::move(args), std::move(returnType), std::move(body), false};
}

FunctionDef generateAsyncMethodDefinition(const std::string& name,
                                          std::vector<Arg> args,
                                          std::string returnType,
                                          std::vector<Stmt> body)
{
    auto function = generateMethodDefinition(name, std::move(args),
                                             std::move(returnType), std::move(body));
    function.isAsync = true;
    return function;
}

ClassDef generateClassDef(const std::string& name, std::vector<std::string> bases) {
    requireIdentifier(name, false, "class name");
    for (const auto& base : bases) {
        requireIdentifier(base, true, "base class");
    }
    return ClassDef{name, std::move(bases), {}};
}

Import generateImport(std::vector<std::string> names, std::string module, bool system) {
    return Import{std::move(module), std::move(names), system};
}

Module generateModule(std::vector<TopLevel> body, std::string nameSpace) {
    if (!nameSpace.empty()) {
        requireIdentifier(nameSpace, true, "namespace");
    }
    return Module{std::move(body), std::move(nameSpace)};
}

std::string generateTemplateType(const std::string& base,
                                 const std::vector<std::string>& args)
{
    std::string type = base + "<";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            type += ", ";
        }
        type += args[i];
    }
    return type + ">";
}

} // namespace graphql_codegen::ast
