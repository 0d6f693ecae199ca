#include "variables.hpp"

#include <utility>

namespace graphql_codegen {

// ---------------------------------------------------------------------------
// FileReferenceMap
// ---------------------------------------------------------------------------

void FileReferenceMap::add(const Upload& file, std::string path) {
    for (auto& entry : mEntries) {
        if (entry.file == file) {
            entry.paths.push_back(std::move(path));
            return;
        }
    }
    mEntries.push_back(Entry{file, {std::move(path)}});
}

const FileReferenceMap::Entry* FileReferenceMap::find(const Upload& file) const {
    for (const auto& entry : mEntries) {
        if (entry.file == file) {
            return &entry;
        }
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

namespace {

Value::Mapping modelToMapping(const BaseModel& model);

/// Values nested inside a model: unset entries are dropped by the caller,
/// nested models and sequences are converted.
Value convertModelField(const Value& value) {
    switch (value.kind()) {
    case Value::Kind::Model:
        return Value(modelToMapping(value.asModel()));
    case Value::Kind::Sequence: {
        Value::Sequence items;
        items.reserve(value.asSequence().size());
        for (const auto& item : value.asSequence()) {
            items.push_back(convertModelField(item));
        }
        return Value(std::move(items));
    }
    case Value::Kind::Mapping: {
        Value::Mapping entries;
        for (const auto& [key, item] : value.asMapping()) {
            if (!item.isUnset()) {
                entries.emplace(key, convertModelField(item));
            }
        }
        return Value(std::move(entries));
    }
    default:
        return value;
    }
}

Value::Mapping modelToMapping(const BaseModel& model) {
    Value::Mapping entries;
    for (const auto& [alias, field] : model.fields()) {
        if (!field.isUnset()) {
            entries.emplace(alias, convertModelField(field));
        }
    }
    return entries;
}

} // namespace

Value normalizeValue(const Value& value) {
    if (value.kind() == Value::Kind::Model) {
        return Value(modelToMapping(value.asModel()));
    }
    if (value.kind() == Value::Kind::Sequence) {
        Value::Sequence items;
        items.reserve(value.asSequence().size());
        for (const auto& item : value.asSequence()) {
            items.push_back(normalizeValue(item));
        }
        return Value(std::move(items));
    }
    return value;
}

Value::Mapping normalizeVariables(const Variables& variables) {
    Value::Mapping normalized;
    for (const auto& [name, value] : variables) {
        if (value.isUnset()) {
            continue;
        }
        normalized.emplace(name, normalizeValue(value));
    }
    return normalized;
}

// ---------------------------------------------------------------------------
// File extraction
// ---------------------------------------------------------------------------

namespace {

class FileSeparator {
public:
    explicit FileSeparator(FileReferenceMap& files) : mFiles(files) {}

    nlohmann::json separate(const std::string& path, const Value& value) {
        return value.visit([&](const auto& item) { return (*this)(path, item); });
    }

    nlohmann::json operator()(const std::string&, const Unset&) {
        return nullptr;
    }

    nlohmann::json operator()(const std::string&, const nlohmann::json& scalar) {
        return scalar;
    }

    nlohmann::json operator()(const std::string& path, const Value::Sequence& items) {
        nlohmann::json nulled = nlohmann::json::array();
        for (std::size_t index = 0; index < items.size(); ++index) {
            nulled.push_back(separate(path + "." + std::to_string(index), items[index]));
        }
        return nulled;
    }

    nlohmann::json operator()(const std::string& path, const Value::Mapping& entries) {
        nlohmann::json nulled = nlohmann::json::object();
        for (const auto& [key, item] : entries) {
            // Unset has no JSON form; inside a mapping the key is left out.
            if (item.isUnset()) {
                continue;
            }
            nulled[key] = separate(path + "." + key, item);
        }
        return nulled;
    }

    nlohmann::json operator()(const std::string& path, const Upload& file) {
        mFiles.add(file, path);
        return nullptr;
    }

    nlohmann::json operator()(const std::string& path, const BaseModel& model) {
        return (*this)(path, modelToMapping(model));
    }

private:
    FileReferenceMap& mFiles;
};

} // namespace

ExtractedVariables extractFiles(const Value::Mapping& variables) {
    ExtractedVariables extracted;
    FileSeparator separator(extracted.files);
    extracted.variables = separator("variables", variables);
    return extracted;
}

} // namespace graphql_codegen
