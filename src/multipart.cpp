#include "multipart.hpp"
#include "util.hpp"

#include <stdexcept>

namespace graphql_codegen {

namespace {

// Percent-encode the characters that would end a quoted header parameter.
std::string escapeQuoted(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"':  escaped += "%22"; break;
        case '\r': escaped += "%0D"; break;
        case '\n': escaped += "%0A"; break;
        default:   escaped += c;
        }
    }
    return escaped;
}

} // namespace

MultipartFormData::MultipartFormData() : mBoundary(makeBoundary()) {}

MultipartFormData::MultipartFormData(std::string boundary)
    : mBoundary(std::move(boundary))
{
    if (mBoundary.empty() || mBoundary.size() > 70) {
        throw std::invalid_argument("Multipart boundary must be 1-70 characters");
    }
}

void MultipartFormData::addField(const std::string& name, const std::string& value) {
    mParts.push_back(Part{name, std::nullopt, "", value});
}

void MultipartFormData::addFile(const std::string& name,
                                const std::string& filename,
                                const std::string& contentType,
                                const std::string& data)
{
    mParts.push_back(Part{name, filename, contentType, data});
}

std::string MultipartFormData::contentType() const {
    return "multipart/form-data; boundary=" + mBoundary;
}

std::string MultipartFormData::body() const {
    std::string out;
    for (const auto& part : mParts) {
        out += "--" + mBoundary + "\r\n";
        out += "Content-Disposition: form-data; name=\"" + escapeQuoted(part.name) + "\"";
        if (part.filename) {
            out += "; filename=\"" + escapeQuoted(*part.filename) + "\"";
        }
        out += "\r\n";
        if (!part.contentType.empty()) {
            out += "Content-Type: " + part.contentType + "\r\n";
        }
        out += "\r\n";
        out += part.data;
        out += "\r\n";
    }
    out += "--" + mBoundary + "--\r\n";
    return out;
}

} // namespace graphql_codegen
