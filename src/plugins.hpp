#pragma once

#include "ast.hpp"

#include <memory>
#include <vector>

namespace graphql_codegen {

/// Rewrites generated nodes. Every hook receives a node and returns a node
/// of the same kind; the defaults return it untouched.
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual ast::FunctionDef generateGqlFunction(ast::FunctionDef function) { return function; }
    virtual ast::ClassDef    generateClientClass(ast::ClassDef classDef)    { return classDef; }
    virtual ast::FunctionDef generateClientMethod(ast::FunctionDef method)  { return method; }
    virtual ast::Module      generateClientModule(ast::Module module)       { return module; }
    virtual ast::Import      generateClientImport(ast::Import import)       { return import; }
};

/// Runs every hook through the plugins in registration order.
class PluginManager {
public:
    PluginManager() = default;
    explicit PluginManager(std::vector<std::shared_ptr<Plugin>> plugins);

    void addPlugin(std::shared_ptr<Plugin> plugin);

    bool        empty() const { return mPlugins.empty(); }
    std::size_t size()  const { return mPlugins.size(); }

    ast::FunctionDef generateGqlFunction(ast::FunctionDef function) const;
    ast::ClassDef    generateClientClass(ast::ClassDef classDef) const;
    ast::FunctionDef generateClientMethod(ast::FunctionDef method) const;
    ast::Module      generateClientModule(ast::Module module) const;
    ast::Import      generateClientImport(ast::Import import) const;

private:
    std::vector<std::shared_ptr<Plugin>> mPlugins;
};

} // namespace graphql_codegen
