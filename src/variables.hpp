#pragma once

#include "value.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace graphql_codegen {

/// Files found in a variables structure, in first-encounter order, each with
/// every dotted path (e.g. "variables.input.files.0") it is bound at.
class FileReferenceMap {
public:
    struct Entry {
        Upload                   file;
        std::vector<std::string> paths;
    };

    void add(const Upload& file, std::string path);

    bool        empty() const { return mEntries.empty(); }
    std::size_t size()  const { return mEntries.size(); }

    const std::vector<Entry>& entries() const { return mEntries; }

    /// nullptr when @p file was never added.
    const Entry* find(const Upload& file) const;

private:
    std::vector<Entry> mEntries;
};

/// Variables with every upload replaced by null, plus where the uploads were.
struct ExtractedVariables {
    nlohmann::json   variables = nlohmann::json::object();
    FileReferenceMap files;
};

/// Drops unset top-level arguments and converts models to plain mappings.
Value::Mapping normalizeVariables(const Variables& variables);

/// Converts one argument value: models become alias-keyed mappings without
/// their unset fields, sequences are converted element-wise, anything else
/// is returned unchanged.
Value normalizeValue(const Value& value);

/// Walks normalized variables from the root path "variables", pulling out
/// uploads.
ExtractedVariables extractFiles(const Value::Mapping& variables);

} // namespace graphql_codegen
