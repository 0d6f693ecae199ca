#pragma once

#include "ast.hpp"

#include <string>
#include <vector>

namespace graphql_codegen {

/// How a custom GraphQL scalar maps onto C++.
struct ScalarData {
    std::string graphqlName;   // e.g. "DateTime"
    std::string typeName;      // C++ type, e.g. "std::chrono::system_clock::time_point"
    std::string include;       // header providing the type / functions; may be empty
    std::string serialize;     // function T -> JSON-convertible value; may be empty
    std::string parse;         // function JSON -> T; may be empty
};

/// Imports a generated client needs for @p data (none if it has no include).
std::vector<ast::Import> generateScalarImports(const ScalarData& data);

} // namespace graphql_codegen
