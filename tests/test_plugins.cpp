/// @file test_plugins.cpp
/// Unit tests for plugins.hpp and the hook points of the client generator.

#include "client_generator.hpp"
#include "plugins.hpp"
#include "renderer.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace graphql_codegen;

namespace {

/// Overrides every hook without changing anything.
class IdentityPlugin : public Plugin {
public:
    ast::FunctionDef generateGqlFunction(ast::FunctionDef function) override { return function; }
    ast::ClassDef    generateClientClass(ast::ClassDef classDef) override { return classDef; }
    ast::FunctionDef generateClientMethod(ast::FunctionDef method) override { return method; }
    ast::Module      generateClientModule(ast::Module module) override { return module; }
    ast::Import      generateClientImport(ast::Import import) override { return import; }
};

/// Records hook calls as "<tag>:<hook>".
class TracingPlugin : public Plugin {
public:
    TracingPlugin(std::string tag, std::vector<std::string>& trace)
        : mTag(std::move(tag)), mTrace(trace) {}

    ast::FunctionDef generateGqlFunction(ast::FunctionDef function) override {
        mTrace.push_back(mTag + ":gql");
        return function;
    }
    ast::ClassDef generateClientClass(ast::ClassDef classDef) override {
        mTrace.push_back(mTag + ":class");
        return classDef;
    }
    ast::FunctionDef generateClientMethod(ast::FunctionDef method) override {
        mTrace.push_back(mTag + ":method:" + method.name);
        return method;
    }
    ast::Module generateClientModule(ast::Module module) override {
        mTrace.push_back(mTag + ":module");
        return module;
    }

private:
    std::string               mTag;
    std::vector<std::string>& mTrace;
};

/// Prefixes method names and drops the <vector> include.
class RewritingPlugin : public Plugin {
public:
    ast::FunctionDef generateClientMethod(ast::FunctionDef method) override {
        method.name = "fetch_" + method.name;
        return method;
    }
    ast::Import generateClientImport(ast::Import import) override {
        if (import.module == "vector") {
            import.names.clear();
        }
        return import;
    }
    ast::ClassDef generateClientClass(ast::ClassDef classDef) override {
        classDef.name = "Renamed";
        return classDef;
    }
};

std::string generateSource(const PluginManager* plugins) {
    SchemaTypes schema;
    schema.enums = {"Role"};
    ArgumentsGenerator arguments(schema);

    ClientGeneratorOptions options;
    options.enumsModuleName  = "enums.hpp";
    options.baseClientImport = ast::generateImport({"graphql_codegen::BaseClient"}, "base_client.hpp");
    options.unsetImport      = ast::generateImport({"graphql_codegen::UNSET"}, "value.hpp");
    ClientGenerator generator(options, arguments, plugins);

    generator.addMethod(
        OperationDefinition{"ListUsers", {{"role", parseTypeRef("Role"), false}}, "query { users }"},
        "listUsers", "Users", "types.hpp", "query ListUsers($role: Role) {\n  users(role: $role)\n}", false);
    generator.addMethod(
        OperationDefinition{"Ping", {}, "query { ping }"},
        "ping", "Ping", "types.hpp", "query Ping { ping }", true);
    return Renderer().renderModule(generator.generate());
}

} // namespace

TEST(PluginManager, NullPluginThrows) {
    PluginManager manager;
    EXPECT_THROW(manager.addPlugin(nullptr), std::invalid_argument);
    EXPECT_TRUE(manager.empty());
}

TEST(PluginManager, DefaultHooksAreIdentity) {
    PluginManager manager({std::make_shared<Plugin>()});
    EXPECT_EQ(manager.size(), 1u);

    auto import = manager.generateClientImport(ast::generateImport({"A"}, "a.hpp"));
    EXPECT_EQ(import.module, "a.hpp");
    EXPECT_EQ(import.names, std::vector<std::string>{"A"});
}

TEST(PluginHooks, IdentityPluginsLeaveOutputByteIdentical) {
    PluginManager identities({std::make_shared<IdentityPlugin>(), std::make_shared<IdentityPlugin>()});
    PluginManager empty;

    auto reference = generateSource(nullptr);
    EXPECT_EQ(generateSource(&identities), reference);
    EXPECT_EQ(generateSource(&empty), reference);
}

TEST(PluginHooks, HooksRunInRegistrationAndGenerationOrder) {
    std::vector<std::string> trace;
    PluginManager manager({std::make_shared<TracingPlugin>("a", trace),
                           std::make_shared<TracingPlugin>("b", trace)});
    generateSource(&manager);

    EXPECT_EQ(trace, (std::vector<std::string>{
        "a:method:listUsers", "b:method:listUsers",
        "a:method:ping", "b:method:ping",
        "a:gql", "b:gql",
        "a:class", "b:class",
        "a:module", "b:module",
    }));
}

TEST(PluginHooks, RewritesReachTheOutput) {
    PluginManager manager({std::make_shared<RewritingPlugin>()});
    auto text = generateSource(&manager);

    EXPECT_NE(text.find("Users fetch_listUsers("), std::string::npos);
    EXPECT_NE(text.find("Ping fetch_ping("), std::string::npos);
    EXPECT_NE(text.find("class Renamed : public graphql_codegen::BaseClient"), std::string::npos);
    EXPECT_EQ(text.find("#include <vector>"), std::string::npos);
    EXPECT_NE(text.find("#include \"enums.hpp\""), std::string::npos);
}

TEST(PluginHooks, MethodOrderSurvivesRewrites) {
    PluginManager manager({std::make_shared<RewritingPlugin>()});
    auto text = generateSource(&manager);
    EXPECT_LT(text.find("fetch_listUsers("), text.find("fetch_ping("));
}
