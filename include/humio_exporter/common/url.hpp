#pragma once

#include <string>
#include <optional>

namespace humio_exporter {
namespace common {

struct Url {
    std::string scheme;
    std::string opaque;
    std::string userinfo;
    bool has_userinfo = false;
    std::string host;
    std::string path;
    std::string raw_query;
    bool force_query = false;
    std::string fragment;
    
    bool isOpaque() const { return !opaque.empty(); }
    std::string toString() const;
};

struct UrlParseResult {
    std::optional<Url> url;
    std::string error;
    
    bool ok() const { return url.has_value(); }
};

// Parses an absolute URL or a relative reference. Percent escapes in the
// path and fragment are decoded; toString() re-escapes them.
UrlParseResult parseUrl(const std::string& text);

// Lexical cleanup of a slash separated path: repeated separators collapse,
// "." segments vanish, ".." removes the previous segment and trailing
// separators are dropped. An empty result becomes ".".
std::string cleanPath(const std::string& path);

// Joins the non-empty elements with '/' and cleans the result.
std::string joinPath(const std::string& base, const std::string& sub);

// Parses base_endpoint and appends sub_path to whatever path it already
// carries. Shared by validation and sanitization so both agree on the result.
UrlParseResult deriveEndpoint(const std::string& base_endpoint, const std::string& sub_path);

}}
