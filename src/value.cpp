#include "value.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

namespace graphql_codegen {

// ---------------------------------------------------------------------------
// Upload
// ---------------------------------------------------------------------------

Upload::Upload(std::shared_ptr<std::istream> stream,
               std::string filename,
               std::string contentType)
    : mStream(std::move(stream))
    , mFilename(std::move(filename))
    , mContentType(std::move(contentType))
{
    if (!mStream) {
        throw std::invalid_argument("Upload requires a stream");
    }
}

Upload Upload::fromFile(const std::string& path, const std::string& contentType) {
    auto stream = std::make_shared<std::ifstream>(path, std::ios::in | std::ios::binary);
    if (!stream->is_open()) {
        throw std::runtime_error("Cannot open file for upload: " + path);
    }

    auto slash = path.find_last_of("/\\");
    std::string filename = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return Upload(std::move(stream), std::move(filename), contentType);
}

Upload Upload::fromBytes(std::string filename, std::string bytes, std::string contentType) {
    auto stream = std::make_shared<std::istringstream>(
        std::move(bytes), std::ios::in | std::ios::binary);
    return Upload(std::move(stream), std::move(filename), std::move(contentType));
}

std::string Upload::read() const {
    std::string content{std::istreambuf_iterator<char>(*mStream),
                        std::istreambuf_iterator<char>()};
    if (mStream->bad()) {
        throw std::runtime_error("Failed to read upload: " + mFilename);
    }
    return content;
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

Value::Value(nlohmann::json scalar) : mData(std::move(scalar)) {}

Value::Value(Sequence items)
    : mData(std::make_shared<const Sequence>(std::move(items))) {}

Value::Value(Mapping entries)
    : mData(std::make_shared<const Mapping>(std::move(entries))) {}

Value::Value(ModelPtr model) : mData(std::move(model)) {
    if (!std::get<ModelPtr>(mData)) {
        throw std::invalid_argument("Value cannot hold a null model");
    }
}

bool Value::isNull() const {
    return kind() == Kind::Scalar && std::get<nlohmann::json>(mData).is_null();
}

const nlohmann::json& Value::asScalar() const {
    if (kind() != Kind::Scalar) {
        throw std::logic_error("Value is not a scalar");
    }
    return std::get<nlohmann::json>(mData);
}

const Value::Sequence& Value::asSequence() const {
    if (kind() != Kind::Sequence) {
        throw std::logic_error("Value is not a sequence");
    }
    return *std::get<std::shared_ptr<const Sequence>>(mData);
}

const Value::Mapping& Value::asMapping() const {
    if (kind() != Kind::Mapping) {
        throw std::logic_error("Value is not a mapping");
    }
    return *std::get<std::shared_ptr<const Mapping>>(mData);
}

const Upload& Value::asUpload() const {
    if (kind() != Kind::Upload) {
        throw std::logic_error("Value is not an upload");
    }
    return std::get<Upload>(mData);
}

const BaseModel& Value::asModel() const {
    if (kind() != Kind::Model) {
        throw std::logic_error("Value is not a model");
    }
    return *std::get<ModelPtr>(mData);
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
    case Value::Kind::Unset:    return true;
    case Value::Kind::Scalar:   return lhs.asScalar() == rhs.asScalar();
    case Value::Kind::Sequence: return lhs.asSequence() == rhs.asSequence();
    case Value::Kind::Mapping:  return lhs.asMapping() == rhs.asMapping();
    case Value::Kind::Upload:   return lhs.asUpload() == rhs.asUpload();
    case Value::Kind::Model:    break;
    }
    // Models compare by identity.
    return &lhs.asModel() == &rhs.asModel();
}

} // namespace graphql_codegen
