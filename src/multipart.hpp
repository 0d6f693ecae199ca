#pragma once

#include <optional>
#include <string>
#include <vector>

namespace graphql_codegen {

/// multipart/form-data body builder (RFC 7578).
class MultipartFormData {
public:
    /// Random boundary.
    MultipartFormData();
    explicit MultipartFormData(std::string boundary);

    void addField(const std::string& name, const std::string& value);

    void addFile(const std::string& name,
                 const std::string& filename,
                 const std::string& contentType,
                 const std::string& data);

    const std::string& boundary() const { return mBoundary; }

    /// "multipart/form-data; boundary=<boundary>"
    std::string contentType() const;

    std::string body() const;

private:
    struct Part {
        std::string                name;
        std::optional<std::string> filename;
        std::string                contentType;
        std::string                data;
    };

    std::string       mBoundary;
    std::vector<Part> mParts;
};

} // namespace graphql_codegen
