#include "renderer.hpp"

#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace graphql_codegen {

namespace {

std::string indent(std::size_t indentation) {
    return std::string(indentation * Renderer::kSpacesPerIndent, ' ');
}

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string quoteString(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char octal[5];
                std::snprintf(octal, sizeof(octal), "\\%03o", static_cast<unsigned char>(c));
                out += octal;
            } else {
                out += c;
            }
        }
    }
    return out + "\"";
}

// ---------------------------------------------------------------------------
// Module
// ---------------------------------------------------------------------------

std::string Renderer::renderModule(const ast::Module& module) const {
    std::string out = "// Generated by graphql-codegen. Do not edit.\n"
                      "#pragma once\n";

    // Includes cannot live inside the namespace, so imports come first.
    bool anyImport = false;
    for (const auto& node : module.body) {
        if (const auto* import = std::get_if<ast::Import>(&node)) {
            if (!anyImport) {
                out += "\n";
                anyImport = true;
            }
            out += renderImport(*import);
        }
    }

    if (!module.nameSpace.empty()) {
        out += "\nnamespace " + module.nameSpace + " {\n";
    }

    for (const auto& node : module.body) {
        if (const auto* function = std::get_if<ast::FunctionDef>(&node)) {
            out += "\n" + renderFunction(*function, 0, false);
        } else if (const auto* classDef = std::get_if<ast::ClassDef>(&node)) {
            out += "\n" + renderClass(*classDef, 0);
        }
    }

    if (!module.nameSpace.empty()) {
        out += "\n} // namespace " + module.nameSpace + "\n";
    }
    return out;
}

std::string Renderer::renderImport(const ast::Import& import) const {
    if (import.system) {
        return "#include <" + import.module + ">\n";
    }
    return "#include \"" + import.module + "\"\n";
}

// ---------------------------------------------------------------------------
// Definitions
// ---------------------------------------------------------------------------

std::string Renderer::renderSignature(const ast::FunctionDef& function) const {
    std::vector<std::string> params;
    if (function.isAsync) {
        params.push_back(std::string(kYieldType) + " " + kYieldParameter);
    }
    for (const auto& arg : function.args) {
        std::string param = arg.byReference ? "const " + arg.annotation + "& " + arg.name
                                            : arg.annotation + " " + arg.name;
        if (arg.defaultValue) {
            param += " = " + renderExpression(arg.defaultValue, 0);
        }
        params.push_back(std::move(param));
    }

    std::string signature = function.returnType + " " + function.name + "(";
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) {
            signature += ", ";
        }
        signature += params[i];
    }
    return signature + ")";
}

std::string Renderer::renderFunction(const ast::FunctionDef& function,
                                     std::size_t indentation,
                                     bool isMember) const
{
    std::string out = indent(indentation);
    if (!isMember) {
        out += "inline ";
    }
    out += renderSignature(function) + "\n";
    out += indent(indentation) + "{\n";
    for (const auto& statement : function.body) {
        out += renderStatement(statement, indentation + 1);
    }
    out += indent(indentation) + "}\n";
    return out;
}

std::string Renderer::renderClass(const ast::ClassDef& classDef, std::size_t indentation) const {
    std::string out = indent(indentation) + "class " + classDef.name;
    for (std::size_t i = 0; i < classDef.bases.size(); ++i) {
        out += (i == 0 ? " : public " : ", public ") + classDef.bases[i];
    }
    out += "\n" + indent(indentation) + "{\n";
    out += indent(indentation) + "public:\n";

    // Generated clients are constructed exactly like their base.
    for (const auto& base : classDef.bases) {
        auto unqualified = base.substr(base.rfind(':') == std::string::npos ? 0 : base.rfind(':') + 1);
        out += indent(indentation + 1) + "using " + base + "::" + unqualified + ";\n";
    }

    for (std::size_t i = 0; i < classDef.body.size(); ++i) {
        if (i > 0 || !classDef.bases.empty()) {
            out += "\n";
        }
        out += renderFunction(classDef.body[i], indentation + 1, true);
    }
    out += indent(indentation) + "};\n";
    return out;
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

std::string Renderer::renderStatement(const ast::Stmt& statement, std::size_t indentation) const {
    return std::visit(overloaded{
        [&](const ast::Assign& assign) {
            return indent(indentation) + "auto const " + assign.target + " = "
                 + renderExpression(assign.value, indentation) + ";\n";
        },
        [&](const ast::AnnAssign& assign) {
            auto value = renderExpression(assign.value, indentation);
            if (std::holds_alternative<ast::MapLiteral>(assign.value->node)) {
                return indent(indentation) + assign.annotation + " " + assign.target
                     + value + ";\n";
            }
            return indent(indentation) + assign.annotation + " " + assign.target
                 + " = " + value + ";\n";
        },
        [&](const ast::Return& ret) {
            return indent(indentation) + "return "
                 + renderExpression(ret.value, indentation) + ";\n";
        },
    }, statement);
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

namespace {

std::string renderCall(const Renderer& renderer,
                       const ast::Call& call,
                       std::size_t indentation,
                       const std::string& extraArgument)
{
    std::vector<std::string> args;
    for (const auto& arg : call.args) {
        args.push_back(renderer.renderExpression(arg, indentation));
    }
    for (const auto& keyword : call.keywords) {
        args.push_back("/*" + keyword.arg + "=*/"
                       + renderer.renderExpression(keyword.value, indentation));
    }
    if (!extraArgument.empty()) {
        args.push_back(extraArgument);
    }

    std::string out = renderer.renderExpression(call.func, indentation) + "(";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += args[i];
    }
    return out + ")";
}

} // namespace

std::string Renderer::renderExpression(const ast::ExprPtr& expr, std::size_t indentation) const {
    if (!expr) {
        throw std::invalid_argument("Cannot render a missing expression");
    }

    return std::visit(overloaded{
        [&](const ast::Name& name) {
            return name.id;
        },
        [&](const ast::Constant& constant) {
            return std::visit([](const auto& value) -> std::string {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, std::nullptr_t>) {
                    return "nullptr";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return value ? "true" : "false";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return quoteString(value);
                } else if constexpr (std::is_same_v<T, double>) {
                    std::ostringstream os;
                    os << std::setprecision(17) << value;
                    auto text = os.str();
                    if (text.find_first_of(".eEn") == std::string::npos) {
                        text += ".0";
                    }
                    return text;
                } else {
                    return std::to_string(value);
                }
            }, constant.value);
        },
        [&](const ast::StringBlock& block) {
            if (block.lines.empty()) {
                return std::string("\"\"");
            }
            if (block.lines.size() == 1) {
                return quoteString(block.lines.front());
            }
            std::string out;
            for (const auto& line : block.lines) {
                out += "\n" + indent(indentation + 1) + quoteString(line);
            }
            return out;
        },
        [&](const ast::Attribute& attribute) {
            const char* separator = attribute.access == ast::Access::Member  ? "."
                                  : attribute.access == ast::Access::Pointer ? "->"
                                                                            : "::";
            return renderExpression(attribute.value, indentation) + separator + attribute.attr;
        },
        [&](const ast::Call& call) {
            return renderCall(*this, call, indentation, "");
        },
        [&](const ast::Await& await) {
            const auto* call = std::get_if<ast::Call>(&await.value->node);
            if (!call) {
                throw std::invalid_argument("Only a call can be awaited");
            }
            return renderCall(*this, *call, indentation, kYieldParameter);
        },
        [&](const ast::MapLiteral& map) {
            if (map.entries.empty()) {
                return std::string("{}");
            }
            std::string out = "{\n";
            for (const auto& [key, value] : map.entries) {
                out += indent(indentation + 1) + "{"
                     + renderExpression(key, indentation + 1) + ", "
                     + renderExpression(value, indentation + 1) + "},\n";
            }
            return out + indent(indentation) + "}";
        },
    }, expr->node);
}

} // namespace graphql_codegen
