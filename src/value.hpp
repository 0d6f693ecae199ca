#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace graphql_codegen {

/// Marks an argument that was not supplied. GraphQL distinguishes an absent
/// argument from one explicitly set to null, so this is never the same as null.
struct Unset {};

inline constexpr Unset UNSET{};

inline bool operator==(Unset, Unset) { return true; }
inline bool operator!=(Unset, Unset) { return false; }

/// A binary stream sent as one file part of a multipart request.
/// Copies share the stream; two Uploads are equal only if they share it.
class Upload {
public:
    Upload(std::shared_ptr<std::istream> stream,
           std::string filename,
           std::string contentType = "application/octet-stream");

    /// Opens @p path for binary reading.
    /// @throws std::runtime_error if the file cannot be opened.
    static Upload fromFile(const std::string& path,
                           const std::string& contentType = "application/octet-stream");

    static Upload fromBytes(std::string filename,
                            std::string bytes,
                            std::string contentType = "application/octet-stream");

    const std::string& filename()    const { return mFilename; }
    const std::string& contentType() const { return mContentType; }

    /// Reads the stream from its current position to the end.
    std::string read() const;

    bool operator==(const Upload& other) const { return mStream == other.mStream; }
    bool operator!=(const Upload& other) const { return !(*this == other); }

private:
    std::shared_ptr<std::istream> mStream;
    std::string mFilename;
    std::string mContentType;
};

/// Argument that may be unset, null, or hold a T. Default-constructs unset.
template <typename T>
class Optional {
public:
    Optional() = default;
    Optional(Unset) {}
    Optional(std::nullptr_t) : mData(std::in_place_index<1>, nullptr) {}
    Optional(std::nullopt_t) : mData(std::in_place_index<1>, nullptr) {}

    template <typename U = T,
              typename = std::enable_if_t<
                  std::is_constructible_v<T, U&&> &&
                  !std::is_same_v<std::decay_t<U>, Optional> &&
                  !std::is_same_v<std::decay_t<U>, Unset> &&
                  !std::is_same_v<std::decay_t<U>, std::nullptr_t> &&
                  !std::is_same_v<std::decay_t<U>, std::nullopt_t>>>
    Optional(U&& value)
        : mData(std::in_place_index<2>, std::forward<U>(value)) {}

    bool isUnset()  const { return mData.index() == 0; }
    bool isNull()   const { return mData.index() == 1; }
    bool hasValue() const { return mData.index() == 2; }

    const T& value() const {
        if (!hasValue()) {
            throw std::logic_error("Optional argument holds no value");
        }
        return std::get<2>(mData);
    }

private:
    std::variant<Unset, std::nullptr_t, T> mData;
};

class BaseModel;

/// Variable value bound by a generated method: a closed set of shapes.
class Value {
public:
    using Sequence = std::vector<Value>;
    using Mapping  = std::map<std::string, Value>;
    using ModelPtr = std::shared_ptr<const BaseModel>;

    enum class Kind { Unset, Scalar, Sequence, Mapping, Upload, Model };

    Value() : mData(nlohmann::json(nullptr)) {}
    Value(Unset) : mData(Unset{}) {}
    Value(std::nullptr_t) : mData(nlohmann::json(nullptr)) {}
    Value(nlohmann::json scalar);
    Value(const char* text) : mData(nlohmann::json(text)) {}
    Value(std::string text) : mData(nlohmann::json(std::move(text))) {}
    Value(Upload upload) : mData(std::move(upload)) {}
    Value(Sequence items);
    Value(Mapping entries);
    Value(ModelPtr model);

    template <typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
    Value(T number) : mData(nlohmann::json(number)) {}

    /// Enums convert through their nlohmann to_json.
    template <typename T, std::enable_if_t<std::is_enum_v<T>, int> = 0>
    Value(T enumValue) : mData(nlohmann::json(enumValue)) {}

    template <typename T,
              std::enable_if_t<std::is_base_of_v<BaseModel, T>, int> = 0>
    Value(const T& model) : Value(ModelPtr(std::make_shared<T>(model))) {}

    template <typename T>
    Value(const std::vector<T>& items) : Value(toSequence(items)) {}

    template <typename T>
    Value(const Optional<T>& argument) : Value(fromOptional(argument)) {}

    template <typename T>
    Value(const std::optional<T>& argument)
        : Value(argument ? Value(*argument) : Value(nullptr)) {}

    /// Applies @p serialize to every element of a (possibly nested) argument,
    /// keeping unset and null states as they are.
    template <typename T, typename F>
    static Value serialized(const Optional<T>& argument, const F& serialize) {
        if (argument.isUnset()) return Value(UNSET);
        if (argument.isNull())  return Value(nullptr);
        return serialized(argument.value(), serialize);
    }

    template <typename T, typename F>
    static Value serialized(const std::vector<T>& items, const F& serialize) {
        Sequence sequence;
        sequence.reserve(items.size());
        for (const auto& item : items) {
            sequence.push_back(serialized(item, serialize));
        }
        return Value(std::move(sequence));
    }

    template <typename T, typename F>
    static Value serialized(const T& argument, const F& serialize) {
        return Value(serialize(argument));
    }

    Kind kind() const { return static_cast<Kind>(mData.index()); }

    bool isUnset() const { return kind() == Kind::Unset; }
    bool isNull()  const;

    const nlohmann::json& asScalar()   const;
    const Sequence&       asSequence() const;
    const Mapping&        asMapping()  const;
    const Upload&         asUpload()   const;
    const BaseModel&      asModel()    const;

    /// Calls @p visitor with the held alternative: Unset, nlohmann::json,
    /// Sequence, Mapping, Upload or BaseModel.
    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        switch (kind()) {
        case Kind::Unset:    return visitor(std::get<0>(mData));
        case Kind::Scalar:   return visitor(asScalar());
        case Kind::Sequence: return visitor(asSequence());
        case Kind::Mapping:  return visitor(asMapping());
        case Kind::Upload:   return visitor(asUpload());
        case Kind::Model:    break;
        }
        return visitor(asModel());
    }

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

private:
    template <typename T>
    static Sequence toSequence(const std::vector<T>& items) {
        Sequence sequence;
        sequence.reserve(items.size());
        for (const auto& item : items) {
            sequence.emplace_back(item);
        }
        return sequence;
    }

    template <typename T>
    static Value fromOptional(const Optional<T>& argument) {
        if (argument.isUnset()) return Value(UNSET);
        if (argument.isNull())  return Value(nullptr);
        return Value(argument.value());
    }

    std::variant<Unset,
                 nlohmann::json,
                 std::shared_ptr<const Sequence>,
                 std::shared_ptr<const Mapping>,
                 Upload,
                 ModelPtr> mData;
};

/// Structured input object. fields() is keyed by GraphQL field name (the
/// alias); fields the caller never set hold UNSET.
class BaseModel {
public:
    virtual ~BaseModel() = default;

    virtual Value::Mapping fields() const = 0;
};

using Variables = std::map<std::string, Value>;

} // namespace graphql_codegen
