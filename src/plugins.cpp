#include "plugins.hpp"

#include <stdexcept>
#include <utility>

namespace graphql_codegen {

PluginManager::PluginManager(std::vector<std::shared_ptr<Plugin>> plugins) {
    for (auto& plugin : plugins) {
        addPlugin(std::move(plugin));
    }
}

void PluginManager::addPlugin(std::shared_ptr<Plugin> plugin) {
    if (!plugin) {
        throw std::invalid_argument("PluginManager: null plugin");
    }
    mPlugins.push_back(std::move(plugin));
}

ast::FunctionDef PluginManager::generateGqlFunction(ast::FunctionDef function) const {
    for (const auto& plugin : mPlugins) {
        function = plugin->generateGqlFunction(std::move(function));
    }
    return function;
}

ast::ClassDef PluginManager::generateClientClass(ast::ClassDef classDef) const {
    for (const auto& plugin : mPlugins) {
        classDef = plugin->generateClientClass(std::move(classDef));
    }
    return classDef;
}

ast::FunctionDef PluginManager::generateClientMethod(ast::FunctionDef method) const {
    for (const auto& plugin : mPlugins) {
        method = plugin->generateClientMethod(std::move(method));
    }
    return method;
}

ast::Module PluginManager::generateClientModule(ast::Module module) const {
    for (const auto& plugin : mPlugins) {
        module = plugin->generateClientModule(std::move(module));
    }
    return module;
}

ast::Import PluginManager::generateClientImport(ast::Import import) const {
    for (const auto& plugin : mPlugins) {
        import = plugin->generateClientImport(std::move(import));
    }
    return import;
}

} // namespace graphql_codegen
