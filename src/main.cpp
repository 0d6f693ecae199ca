#include "generator_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

struct Options {
    std::string configPath;
    std::string operationsPath;
    std::string outputPath;
    std::string clientName;
    std::string nameSpace;
    bool        async   = false;
    bool        verbose = false;
};

static void printUsage() {
    std::cout
        << "Usage: graphql-codegen --config FILE --operations FILE --output FILE [options]\n\n"
        << "Options:\n"
        << "  --config FILE        Generator settings (JSON)\n"
        << "  --operations FILE    Parsed GraphQL operations (JSON)\n"
        << "  --output FILE        Header to write\n"
        << "  --client-name NAME   Override the generated class name\n"
        << "  --namespace NS       Override the generated code namespace\n"
        << "  --async              Generate coroutine methods\n"
        << "  --verbose            Enable verbose diagnostics\n"
        << "  --help, -h           Show this message\n";
}

static Options parseArgs(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        } else if (arg == "--operations" && i + 1 < argc) {
            opts.operationsPath = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            opts.outputPath = argv[++i];
        } else if (arg == "--client-name" && i + 1 < argc) {
            opts.clientName = argv[++i];
        } else if (arg == "--namespace" && i + 1 < argc) {
            opts.nameSpace = argv[++i];
        } else if (arg == "--async") {
            opts.async = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    if (opts.configPath.empty() || opts.operationsPath.empty() || opts.outputPath.empty()) {
        std::cerr << "--config, --operations and --output are required\n\n";
        printUsage();
        std::exit(1);
    }
    return opts;
}

int main(int argc, char* argv[]) {
    try {
        Options opts = parseArgs(argc, argv);

        auto config = graphql_codegen::loadGeneratorConfig(opts.configPath);
        if (!opts.clientName.empty()) {
            config.clientName = opts.clientName;
        }
        if (!opts.nameSpace.empty()) {
            config.moduleNamespace = opts.nameSpace;
        }
        if (opts.async) {
            config.async = true;
        }

        const auto operations = graphql_codegen::loadOperations(opts.operationsPath);
        if (opts.verbose) {
            std::cerr << "[graphql-codegen] " << operations.size() << " operation(s) from "
                      << opts.operationsPath << "\n"
                      << "[graphql-codegen] Client " << config.clientName
                      << (config.async ? " (async)" : "") << "\n";
        }

        const auto source = graphql_codegen::generateClientSource(config, operations);

        std::ofstream out(opts.outputPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            std::cerr << "[graphql-codegen] Cannot write " << opts.outputPath << "\n";
            return 1;
        }
        out << source;
        out.close();
        if (!out) {
            std::cerr << "[graphql-codegen] Failed writing " << opts.outputPath << "\n";
            return 1;
        }

        if (opts.verbose) {
            std::cerr << "[graphql-codegen] Wrote " << source.size() << " bytes to "
                      << opts.outputPath << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[graphql-codegen] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
