#pragma once

#include <cstddef>
#include <string>

namespace graphql_codegen {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path component (e.g. "/graphql")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Random multipart boundary: a fixed prefix followed by 32 hex digits.
std::string makeBoundary();

/// Body excerpt for diagnostics; cut at @p limit bytes.
std::string truncateForLog(const std::string& body, std::size_t limit = 300);

} // namespace graphql_codegen
