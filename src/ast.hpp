#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/// Syntax tree of a generated client header, and the constructors used to
/// build it. Nodes are plain values; expressions are shared immutably.
namespace graphql_codegen::ast {

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

/// Identifier, possibly namespace-qualified ("gql", "api::GetUser").
struct Name {
    std::string id;
};

struct Constant {
    std::variant<std::nullptr_t, bool, std::int64_t, double, std::string> value;
};

/// String literal spread over adjacent literals, one per element.
struct StringBlock {
    std::vector<std::string> lines;
};

enum class Access {
    Member,    // value.attr
    Pointer,   // value->attr
    Scope      // value::attr
};

struct Attribute {
    ExprPtr     value;
    std::string attr;
    Access      access = Access::Member;
};

/// Named argument; rendered as an annotated positional argument.
struct Keyword {
    std::string arg;
    ExprPtr     value;
};

struct Call {
    ExprPtr              func;
    std::vector<ExprPtr> args;
    std::vector<Keyword> keywords;
};

/// Call made from a coroutine: the enclosing method's yield context is
/// passed along.
struct Await {
    ExprPtr value;
};

/// Braced list of key/value pairs initialising a map.
struct MapLiteral {
    std::vector<std::pair<ExprPtr, ExprPtr>> entries;
};

struct Expr {
    std::variant<Name, Constant, StringBlock, Attribute, Call, Await, MapLiteral> node;
};

// ---------------------------------------------------------------------------
// Statements and definitions
// ---------------------------------------------------------------------------

/// auto const target = value;
struct Assign {
    std::string target;
    ExprPtr     value;
};

/// annotation target{value};
struct AnnAssign {
    std::string target;
    std::string annotation;
    ExprPtr     value;
};

struct Return {
    ExprPtr value;
};

using Stmt = std::variant<Assign, AnnAssign, Return>;

struct Arg {
    std::string name;
    std::string annotation;
    ExprPtr     defaultValue;        // may be null
    bool        byReference = false; // passed as const&
};

struct FunctionDef {
    std::string       name;
    std::vector<Arg>  args;
    std::string       returnType;
    std::vector<Stmt> body;
    bool              isAsync = false;
};

struct ClassDef {
    std::string              name;
    std::vector<std::string> bases;
    std::vector<FunctionDef> body;
};

/// #include of @c module; @c names lists what the module provides.
struct Import {
    std::string              module;
    std::vector<std::string> names;
    bool                     system = false;
};

using TopLevel = std::variant<Import, FunctionDef, ClassDef>;

struct Module {
    std::vector<TopLevel> body;
    std::string           nameSpace;   // empty: global namespace
};

// ---------------------------------------------------------------------------
// Constructors. Identifiers are validated; a malformed one throws
// std::invalid_argument.
// ---------------------------------------------------------------------------

/// True for [A-Za-z_][A-Za-z0-9_]*, optionally joined by "::".
bool isValidIdentifier(const std::string& id, bool allowQualified = false);

ExprPtr generateName(const std::string& id);
ExprPtr generateConstant(std::nullptr_t);
ExprPtr generateConstant(bool value);
ExprPtr generateConstant(std::int64_t value);
ExprPtr generateConstant(double value);
ExprPtr generateConstant(std::string value);
ExprPtr generateConstant(const char* value);
ExprPtr generateStringBlock(std::vector<std::string> lines);
ExprPtr generateAttribute(ExprPtr value, const std::string& attr,
                          Access access = Access::Member);
Keyword generateKeyword(const std::string& arg, ExprPtr value);
ExprPtr generateCall(ExprPtr func,
                     std::vector<ExprPtr> args = {},
                     std::vector<Keyword> keywords = {});
ExprPtr generateAwait(ExprPtr call);
ExprPtr generateMapLiteral(std::vector<std::pair<ExprPtr, ExprPtr>> entries);

Stmt generateAssign(const std::string& target, ExprPtr value);
Stmt generateAnnAssign(const std::string& target, std::string annotation, ExprPtr value);
Stmt generateReturn(ExprPtr value);

Arg generateArg(const std::string& name, std::string annotation,
                ExprPtr defaultValue = nullptr, bool byReference = false);

FunctionDef generateMethodDefinition(const std::string& name,
                                     std::vector<Arg> args,
                                     std::string returnType,
                                     std::vector<Stmt> body);
FunctionDef generateAsyncMethodDefinition(const std::string& name,
                                          std::vector<Arg> args,
                                          std::string returnType,
                                          std::vector<Stmt> body);

ClassDef generateClassDef(const std::string& name, std::vector<std::string> bases);

Import generateImport(std::vector<std::string> names, std::string module,
                      bool system = false);

Module generateModule(std::vector<TopLevel> body, std::string nameSpace = "");

/// "base<arg1, arg2>"
std::string generateTemplateType(const std::string& base,
                                 const std::vector<std::string>& args);

} // namespace graphql_codegen::ast
