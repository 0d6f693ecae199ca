#include "graphql_types.hpp"

#include <cctype>
#include <stdexcept>
#include <utility>

namespace graphql_codegen {

GraphQLType GraphQLType::named(std::string name) {
    GraphQLType type;
    type.kind = Kind::Named;
    type.name = std::move(name);
    return type;
}

GraphQLType GraphQLType::listOf(GraphQLType itemType) {
    GraphQLType type;
    type.kind   = Kind::List;
    type.ofType = std::make_shared<const GraphQLType>(std::move(itemType));
    return type;
}

GraphQLType GraphQLType::nonNull(GraphQLType inner) {
    if (inner.isNonNull()) {
        throw std::invalid_argument("Non-null type cannot wrap a non-null type");
    }
    GraphQLType type;
    type.kind   = Kind::NonNull;
    type.ofType = std::make_shared<const GraphQLType>(std::move(inner));
    return type;
}

const GraphQLType& GraphQLType::namedType() const {
    const GraphQLType* type = this;
    while (type->kind != Kind::Named) {
        type = type->ofType.get();
    }
    return *type;
}

std::string GraphQLType::toString() const {
    switch (kind) {
    case Kind::List:    return "[" + ofType->toString() + "]";
    case Kind::NonNull: return ofType->toString() + "!";
    case Kind::Named:   break;
    }
    return name;
}

bool operator==(const GraphQLType& lhs, const GraphQLType& rhs) {
    if (lhs.kind != rhs.kind || lhs.name != rhs.name) {
        return false;
    }
    if (!lhs.ofType || !rhs.ofType) {
        return !lhs.ofType && !rhs.ofType;
    }
    return *lhs.ofType == *rhs.ofType;
}

// ---------------------------------------------------------------------------
// Type notation parser
// ---------------------------------------------------------------------------

namespace {

class TypeNotationParser {
public:
    explicit TypeNotationParser(const std::string& text) : mText(text) {}

    GraphQLType parse() {
        auto type = parseType();
        skipSpace();
        if (mPos != mText.size()) {
            fail("unexpected trailing characters");
        }
        return type;
    }

private:
    const std::string& mText;
    std::size_t        mPos = 0;

    [[noreturn]] void fail(const std::string& reason) const {
        throw std::invalid_argument("Invalid GraphQL type '" + mText + "': " + reason);
    }

    void skipSpace() {
        while (mPos < mText.size() && std::isspace(static_cast<unsigned char>(mText[mPos]))) {
            ++mPos;
        }
    }

    bool consume(char c) {
        skipSpace();
        if (mPos < mText.size() && mText[mPos] == c) {
            ++mPos;
            return true;
        }
        return false;
    }

    GraphQLType parseType() {
        GraphQLType type;
        if (consume('[')) {
            type = GraphQLType::listOf(parseType());
            if (!consume(']')) {
                fail("missing ']'");
            }
        } else {
            type = GraphQLType::named(parseName());
        }
        if (consume('!')) {
            type = GraphQLType::nonNull(std::move(type));
        }
        return type;
    }

    std::string parseName() {
        skipSpace();
        auto start = mPos;
        if (mPos < mText.size()
            && (std::isalpha(static_cast<unsigned char>(mText[mPos])) || mText[mPos] == '_')) {
            ++mPos;
            while (mPos < mText.size()
                   && (std::isalnum(static_cast<unsigned char>(mText[mPos])) || mText[mPos] == '_')) {
                ++mPos;
            }
        }
        if (start == mPos) {
            fail("expected a type name");
        }
        return mText.substr(start, mPos - start);
    }
};

} // namespace

GraphQLType parseTypeRef(const std::string& notation) {
    return TypeNotationParser(notation).parse();
}

} // namespace graphql_codegen
