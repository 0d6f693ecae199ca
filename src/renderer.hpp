#pragma once

#include "ast.hpp"

#include <string>

namespace graphql_codegen {

/// Renders a generated-client syntax tree as C++ header text.
/// Output is deterministic: equal trees render to identical text.
class Renderer {
public:
    static constexpr std::size_t kSpacesPerIndent = 4;

    /// Name of the coroutine context parameter of async methods.
    static constexpr const char* kYieldParameter = "yield";
    static constexpr const char* kYieldType      = "boost::asio::yield_context";

    std::string renderModule(const ast::Module& module) const;

    std::string renderImport(const ast::Import& import) const;
    std::string renderFunction(const ast::FunctionDef& function,
                               std::size_t indentation,
                               bool isMember) const;
    std::string renderClass(const ast::ClassDef& classDef, std::size_t indentation) const;
    std::string renderStatement(const ast::Stmt& statement, std::size_t indentation) const;
    std::string renderExpression(const ast::ExprPtr& expr, std::size_t indentation) const;

private:
    std::string renderSignature(const ast::FunctionDef& function) const;
};

/// C++ string literal for @p text, with quotes and escapes.
std::string quoteString(const std::string& text);

} // namespace graphql_codegen
