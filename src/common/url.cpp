#include "humio_exporter/common/url.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace humio_exporter {
namespace common {

namespace {

enum class EscapeMode {
    PATH,
    FRAGMENT
};

bool isHex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return c - 'A' + 10;
}

bool isUnreserved(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

bool containsControlByte(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        auto b = static_cast<unsigned char>(c);
        return b < 0x20 || b == 0x7f;
    });
}

bool isValidHostChar(char c) {
    if (static_cast<unsigned char>(c) >= 0x80) return true;
    if (isUnreserved(c)) return true;
    switch (c) {
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=': case ':':
        case '[': case ']': case '<': case '>': case '"':
            return true;
        default:
            return false;
    }
}

bool isValidUserinfoChar(char c) {
    if (isUnreserved(c)) return true;
    switch (c) {
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=': case ':':
        case '%': case '@':
            return true;
        default:
            return false;
    }
}

bool shouldEscape(char c, EscapeMode mode) {
    if (isUnreserved(c)) return false;
    switch (c) {
        case '$': case '&': case '+': case ',': case '/':
        case ':': case ';': case '=': case '@':
            return false;
        case '?':
            return mode == EscapeMode::PATH;
        case '!': case '(': case ')': case '*':
            return mode == EscapeMode::PATH;
        default:
            return true;
    }
}

std::optional<std::string> unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%') {
            if (i + 2 >= s.size() || !isHex(s[i + 1]) || !isHex(s[i + 2])) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>(hexValue(s[i + 1]) * 16 + hexValue(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::string escape(const std::string& s, EscapeMode mode) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (shouldEscape(c, mode)) {
            auto b = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(HEX[b >> 4]);
            out.push_back(HEX[b & 0x0f]);
        } else {
            out.push_back(c);
        }
    }
    return out;
}

// Returns the scheme, or an empty string when the text does not start with
// one. Sets error when the text starts with ':'.
std::string splitScheme(const std::string& text, std::string& rest, std::string& error) {
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (std::isalpha(static_cast<unsigned char>(c))) {
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.') {
            if (i == 0) {
                rest = text;
                return "";
            }
            continue;
        }
        if (c == ':') {
            if (i == 0) {
                error = "missing protocol scheme";
                return "";
            }
            std::string scheme = text.substr(0, i);
            rest = text.substr(i + 1);
            std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            return scheme;
        }
        rest = text;
        return "";
    }
    rest = text;
    return "";
}

bool isValidOptionalPort(const std::string& port) {
    if (port.empty()) return true;
    if (port[0] != ':') return false;
    return std::all_of(port.begin() + 1, port.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

bool parseHost(const std::string& host, std::string& error) {
    std::string name = host;

    if (!host.empty() && host[0] == '[') {
        auto close = host.find(']');
        if (close == std::string::npos) {
            error = "missing ']' in host";
            return false;
        }
        if (!isValidOptionalPort(host.substr(close + 1))) {
            error = "invalid port \"" + host.substr(close + 1) + "\" after host";
            return false;
        }
        name = host.substr(1, close - 1);
    } else {
        auto colon = host.rfind(':');
        if (colon != std::string::npos) {
            std::string port = host.substr(colon);
            if (!isValidOptionalPort(port)) {
                error = "invalid port \"" + port + "\" after host";
                return false;
            }
            name = host.substr(0, colon);
        }
    }

    for (char c : name) {
        if (c == '%' || !isValidHostChar(c)) {
            error = std::string("invalid character \"") + c + "\" in host name";
            return false;
        }
    }
    return true;
}

}

std::string Url::toString() const {
    std::string out;

    if (!scheme.empty()) {
        out += scheme + ":";
    }

    if (!opaque.empty()) {
        out += opaque;
    } else {
        if (!scheme.empty() || !host.empty() || has_userinfo) {
            if (!host.empty() || !path.empty() || has_userinfo) {
                out += "//";
            }
            if (has_userinfo) {
                out += userinfo + "@";
            }
            out += host;
        }
        if (!path.empty() && path[0] != '/' && !host.empty()) {
            out += "/";
        }
        out += escape(path, EscapeMode::PATH);
    }

    if (force_query || !raw_query.empty()) {
        out += "?" + raw_query;
    }
    if (!fragment.empty()) {
        out += "#" + escape(fragment, EscapeMode::FRAGMENT);
    }
    return out;
}

UrlParseResult parseUrl(const std::string& text) {
    UrlParseResult result;
    Url url;

    if (containsControlByte(text)) {
        result.error = "invalid control character in URL";
        return result;
    }

    std::string rest = text;
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        auto fragment = unescape(rest.substr(hash + 1));
        if (!fragment) {
            result.error = "invalid URL escape in fragment";
            return result;
        }
        url.fragment = *fragment;
        rest = rest.substr(0, hash);
    }

    std::string error;
    std::string remainder;
    url.scheme = splitScheme(rest, remainder, error);
    rest = remainder;
    if (!error.empty()) {
        result.error = error;
        return result;
    }

    if (!rest.empty() && rest.back() == '?' && std::count(rest.begin(), rest.end(), '?') == 1) {
        url.force_query = true;
        rest.pop_back();
    } else {
        auto question = rest.find('?');
        if (question != std::string::npos) {
            url.raw_query = rest.substr(question + 1);
            rest = rest.substr(0, question);
        }
    }

    if (rest.empty() || rest[0] != '/') {
        if (!url.scheme.empty()) {
            url.opaque = rest;
            result.url = url;
            return result;
        }
        auto slash = rest.find('/');
        auto colon = rest.find(':');
        if (colon != std::string::npos && (slash == std::string::npos || colon < slash)) {
            result.error = "first path segment in URL cannot contain colon";
            return result;
        }
    }

    if ((!url.scheme.empty() || rest.compare(0, 3, "///") != 0) && rest.compare(0, 2, "//") == 0) {
        std::string authority = rest.substr(2);
        auto slash = authority.find('/');
        if (slash != std::string::npos) {
            rest = authority.substr(slash);
            authority = authority.substr(0, slash);
        } else {
            rest.clear();
        }

        auto at = authority.rfind('@');
        if (at != std::string::npos) {
            std::string userinfo = authority.substr(0, at);
            if (!std::all_of(userinfo.begin(), userinfo.end(), isValidUserinfoChar)) {
                result.error = "invalid userinfo";
                return result;
            }
            url.userinfo = userinfo;
            url.has_userinfo = true;
            authority = authority.substr(at + 1);
        }

        if (!parseHost(authority, error)) {
            result.error = error;
            return result;
        }
        url.host = authority;
    }

    auto path = unescape(rest);
    if (!path) {
        result.error = "invalid URL escape in path";
        return result;
    }
    url.path = *path;

    result.url = url;
    return result;
}

std::string cleanPath(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    bool rooted = path[0] == '/';
    std::vector<std::string> segments;
    size_t start = 0;

    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string segment = path.substr(start, end - start);
        start = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!rooted) {
                segments.push_back(segment);
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string out = rooted ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += "/";
        out += segments[i];
    }

    if (out.empty()) {
        return ".";
    }
    return out;
}

std::string joinPath(const std::string& base, const std::string& sub) {
    std::string joined;
    for (const auto* element : {&base, &sub}) {
        if (element->empty()) continue;
        if (!joined.empty()) joined += "/";
        joined += *element;
    }
    if (joined.empty()) {
        return "";
    }
    return cleanPath(joined);
}

UrlParseResult deriveEndpoint(const std::string& base_endpoint, const std::string& sub_path) {
    auto result = parseUrl(base_endpoint);
    if (!result.ok()) {
        return result;
    }

    if (result.url->isOpaque()) {
        result.error = "cannot append a path to opaque URL \"" + base_endpoint + "\"";
        result.url.reset();
        return result;
    }

    if (!result.url->scheme.empty() && result.url->host.empty()) {
        result.error = "missing host in URL \"" + base_endpoint + "\"";
        result.url.reset();
        return result;
    }

    result.url->path = joinPath(result.url->path, sub_path);
    return result;
}

}}
