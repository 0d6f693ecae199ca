#include "scalars.hpp"

namespace graphql_codegen {

std::vector<ast::Import> generateScalarImports(const ScalarData& data) {
    if (data.include.empty()) {
        return {};
    }

    std::vector<std::string> names;
    if (!data.typeName.empty()) {
        names.push_back(data.typeName);
    }
    if (!data.serialize.empty()) {
        names.push_back(data.serialize);
    }
    if (!data.parse.empty()) {
        names.push_back(data.parse);
    }
    return {ast::generateImport(std::move(names), data.include)};
}

} // namespace graphql_codegen
