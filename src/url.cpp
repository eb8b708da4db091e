#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace deepdive {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool is_valid_scheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    for (char c : scheme) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

// True when the reference starts with "scheme:" (absolute, possibly non-hierarchical)
bool has_scheme(const std::string& reference) {
    size_t colon = reference.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    size_t delimiter = reference.find_first_of("/?#");
    if (delimiter != std::string::npos && delimiter < colon) {
        return false;
    }
    return is_valid_scheme(reference.substr(0, colon));
}

std::string remove_dot_segments(const std::string& path) {
    std::string p = path;
    if (p.empty() || p[0] != '/') {
        p = "/" + p;
    }

    std::vector<std::string> segments;
    bool trailing = false;
    size_t pos = 1;
    while (true) {
        size_t next = p.find('/', pos);
        bool last = next == std::string::npos;
        std::string segment = p.substr(pos, last ? std::string::npos : next - pos);

        if (segment == ".") {
            trailing = last;
        } else if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            trailing = last;
        } else {
            segments.push_back(segment);
            trailing = false;
        }

        if (last) {
            break;
        }
        pos = next + 1;
    }

    std::string result = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += "/";
        result += segments[i];
    }
    if (trailing && !segments.empty()) {
        result += "/";
    }
    return result;
}

bool is_tracking_parameter(const std::string& key) {
    std::string lower = to_lower(key);
    return lower.rfind("utm_", 0) == 0 || lower == "fbclid" || lower == "gclid" ||
           lower == "mc_cid" || lower == "mc_eid";
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

int default_port_for_scheme(const std::string& scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    return -1;
}

int Url::effective_port() const {
    return port != -1 ? port : default_port_for_scheme(scheme);
}

std::string Url::host_for_url() const {
    return ipv6_literal ? "[" + host + "]" : host;
}

std::string Url::origin() const {
    std::string result = scheme + "://" + host_for_url();
    if (port != -1 && port != default_port_for_scheme(scheme)) {
        result += ":" + std::to_string(port);
    }
    return result;
}

std::string Url::path_and_query() const {
    std::string result = path.empty() ? "/" : path;
    if (has_query) {
        result += "?" + query;
    }
    return result;
}

std::string Url::to_string() const {
    std::string result = scheme + "://";
    if (!userinfo.empty()) {
        result += userinfo + "@";
    }
    result += host_for_url();
    if (port != -1) {
        result += ":" + std::to_string(port);
    }
    result += path_and_query();
    if (!fragment.empty()) {
        result += "#" + fragment;
    }
    return result;
}

std::optional<Url> parse_url(const std::string& text) {
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f) {
            return std::nullopt;
        }
    }

    size_t separator = text.find("://");
    if (separator == std::string::npos || separator == 0) {
        return std::nullopt;
    }

    Url url;
    url.scheme = to_lower(text.substr(0, separator));
    if (!is_valid_scheme(url.scheme)) {
        return std::nullopt;
    }

    std::string rest = text.substr(separator + 3);
    size_t authority_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, authority_end);

    size_t at = authority.rfind('@');
    std::string host_port = authority;
    if (at != std::string::npos) {
        url.userinfo = authority.substr(0, at);
        host_port = authority.substr(at + 1);
    }
    if (host_port.empty()) {
        return std::nullopt;
    }

    std::string port_text;
    if (host_port[0] == '[') {
        size_t close = host_port.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        url.host = host_port.substr(1, close - 1);
        url.ipv6_literal = true;
        std::string after = host_port.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                return std::nullopt;
            }
            port_text = after.substr(1);
        }
    } else {
        size_t colon = host_port.rfind(':');
        if (colon == std::string::npos) {
            url.host = host_port;
        } else {
            url.host = host_port.substr(0, colon);
            port_text = host_port.substr(colon + 1);
        }
    }

    if (!port_text.empty()) {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
        int port = std::stoi(port_text);
        if (port < 1 || port > 65535) {
            return std::nullopt;
        }
        url.port = port;
    }

    url.host = to_lower(url.host);
    if (url.host.empty()) {
        return std::nullopt;
    }

    std::string remainder = authority_end == std::string::npos ? "" : rest.substr(authority_end);
    size_t hash = remainder.find('#');
    if (hash != std::string::npos) {
        url.fragment = remainder.substr(hash + 1);
        remainder = remainder.substr(0, hash);
    }
    size_t question = remainder.find('?');
    if (question != std::string::npos) {
        url.query = remainder.substr(question + 1);
        url.has_query = true;
        remainder = remainder.substr(0, question);
    }
    url.path = remainder;

    return url;
}

std::string resolve_url(const std::string& base, const std::string& reference) {
    std::string ref = trim(reference);

    auto base_url = parse_url(base);
    if (!base_url) {
        return "";
    }

    if (has_scheme(ref)) {
        return ref;
    }
    if (ref.rfind("//", 0) == 0) {
        return base_url->scheme + ":" + ref;
    }

    Url result = *base_url;
    result.fragment.clear();

    if (ref.empty()) {
        return result.to_string();
    }
    if (ref[0] == '#') {
        result.fragment = ref.substr(1);
        return result.to_string();
    }

    std::string path_part = ref;
    std::string fragment;
    size_t hash = path_part.find('#');
    if (hash != std::string::npos) {
        fragment = path_part.substr(hash + 1);
        path_part = path_part.substr(0, hash);
    }

    bool has_query = false;
    std::string query;
    size_t question = path_part.find('?');
    if (question != std::string::npos) {
        has_query = true;
        query = path_part.substr(question + 1);
        path_part = path_part.substr(0, question);
    }

    if (!path_part.empty()) {
        if (path_part[0] == '/') {
            result.path = remove_dot_segments(path_part);
        } else {
            std::string base_path = base_url->path.empty() ? "/" : base_url->path;
            std::string directory = base_path.substr(0, base_path.rfind('/') + 1);
            result.path = remove_dot_segments(directory + path_part);
        }
        result.has_query = has_query;
        result.query = query;
    } else if (has_query) {
        result.has_query = true;
        result.query = query;
    }
    result.fragment = fragment;

    return result.to_string();
}

std::string normalize_url(const std::string& url, bool ignore_query) {
    auto parsed = parse_url(url);
    if (!parsed) {
        return to_lower(trim(url));
    }

    std::string result = parsed->scheme + "://" + parsed->host_for_url();
    if (parsed->port != -1 && parsed->port != default_port_for_scheme(parsed->scheme)) {
        result += ":" + std::to_string(parsed->port);
    }

    std::string path = parsed->path.empty() ? "/" : parsed->path;
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    result += path;

    if (!ignore_query && parsed->has_query) {
        std::vector<std::string> kept;
        std::stringstream stream(parsed->query);
        std::string parameter;
        while (std::getline(stream, parameter, '&')) {
            if (parameter.empty()) {
                continue;
            }
            std::string key = parameter.substr(0, parameter.find('='));
            if (!is_tracking_parameter(key)) {
                kept.push_back(parameter);
            }
        }
        if (!kept.empty()) {
            result += "?";
            for (size_t i = 0; i < kept.size(); ++i) {
                if (i > 0) result += "&";
                result += kept[i];
            }
        }
    }

    return result;
}

std::string url_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            result += ' ';
        } else if (c == '%' && i + 2 < value.size()) {
            int high = hex_value(value[i + 1]);
            int low = hex_value(value[i + 2]);
            if (high >= 0 && low >= 0) {
                result += static_cast<char>(high * 16 + low);
                i += 2;
            } else {
                result += c;
            }
        } else {
            result += c;
        }
    }
    return result;
}

std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string result;
    for (char c : value) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += c;
        } else if (c == ' ') {
            result += '+';
        } else {
            result += '%';
            result += hex[uc >> 4];
            result += hex[uc & 0x0F];
        }
    }
    return result;
}

} // namespace deepdive
