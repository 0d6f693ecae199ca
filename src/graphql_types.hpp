#pragma once

#include <memory>
#include <string>
#include <vector>

namespace graphql_codegen {

/// Type reference of a GraphQL variable, e.g. "[ID!]!".
struct GraphQLType {
    enum class Kind { Named, List, NonNull };

    Kind                               kind = Kind::Named;
    std::string                        name;     // Named only
    std::shared_ptr<const GraphQLType> ofType;   // List and NonNull only

    static GraphQLType named(std::string name);
    static GraphQLType listOf(GraphQLType itemType);
    /// @throws std::invalid_argument if @p type is already non-null.
    static GraphQLType nonNull(GraphQLType type);

    bool isNonNull() const { return kind == Kind::NonNull; }

    /// The named type at the bottom of any List / NonNull wrapping.
    const GraphQLType& namedType() const;

    std::string toString() const;
};

bool operator==(const GraphQLType& lhs, const GraphQLType& rhs);
inline bool operator!=(const GraphQLType& lhs, const GraphQLType& rhs) { return !(lhs == rhs); }

/// Parse GraphQL type notation ("Int", "[String!]", "[[ID]!]!").
/// @throws std::invalid_argument on malformed notation.
GraphQLType parseTypeRef(const std::string& notation);

struct VariableDefinition {
    std::string name;
    GraphQLType type;
    bool        hasDefault = false;
};

/// A parsed query or mutation: its name, variables and source text.
struct OperationDefinition {
    std::string                     name;
    std::vector<VariableDefinition> variableDefinitions;
    std::string                     operation;
};

} // namespace graphql_codegen
