#include "url.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace volley {

namespace {

int default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

int parse_port(const std::string& text, const std::string& url) {
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw InvalidURL("Invalid port in URL: " + url);
    }
    int port = std::stoi(text);
    if (port <= 0 || port > 65535) {
        throw InvalidURL("Port out of range in URL: " + url);
    }
    return port;
}

// "/a/b/c" + "d" -> "/a/b/d", with "." and ".." segments folded
std::string merge_paths(const std::string& base, const std::string& ref) {
    std::string dir = "/";
    size_t slash = base.rfind('/');
    if (slash != std::string::npos) {
        dir = base.substr(0, slash + 1);
    }
    std::string joined = dir + ref;

    std::vector<std::string> segments;
    size_t pos = 1;
    while (pos <= joined.size()) {
        size_t next = joined.find('/', pos);
        if (next == std::string::npos) next = joined.size();
        std::string seg = joined.substr(pos, next - pos);
        if (seg == "..") {
            if (!segments.empty()) segments.pop_back();
            if (next == joined.size()) segments.emplace_back();
        } else if (seg == ".") {
            if (next == joined.size()) segments.emplace_back();
        } else {
            segments.push_back(seg);
        }
        pos = next + 1;
    }

    std::string result;
    for (const auto& seg : segments) {
        result += "/";
        result += seg;
    }
    return result.empty() ? "/" : result;
}

} // namespace

URL URL::parse(const std::string& url) {
    URL result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw MissingSchema("No scheme supplied in URL: " + url);
    }

    result.scheme = url.substr(0, scheme_end);
    std::transform(result.scheme.begin(), result.scheme.end(),
                   result.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (result.scheme != "http" && result.scheme != "https") {
        throw InvalidSchema("No connection adapter for scheme '" + result.scheme + "'");
    }

    size_t pos = scheme_end + 3;

    size_t path_start = url.find('/', pos);
    size_t query_start = url.find('?', pos);
    size_t fragment_start = url.find('#', pos);
    size_t host_end = std::min({path_start, query_start, fragment_start});
    if (host_end == std::string::npos) {
        host_end = url.length();
    }

    std::string host_port = url.substr(pos, host_end - pos);

    // Drop userinfo, credentials belong in RequestOptions::auth
    size_t at = host_port.rfind('@');
    if (at != std::string::npos) {
        host_port = host_port.substr(at + 1);
    }

    if (!host_port.empty() && host_port[0] == '[') {
        // IPv6 literal
        size_t close = host_port.find(']');
        if (close == std::string::npos) {
            throw InvalidURL("Unterminated IPv6 address in URL: " + url);
        }
        result.host = host_port.substr(1, close - 1);
        if (close + 1 < host_port.size() && host_port[close + 1] == ':') {
            result.port = parse_port(host_port.substr(close + 2), url);
        } else {
            result.port = default_port(result.scheme);
        }
    } else {
        size_t port_delim = host_port.find(':');
        if (port_delim != std::string::npos) {
            result.host = host_port.substr(0, port_delim);
            result.port = parse_port(host_port.substr(port_delim + 1), url);
        } else {
            result.host = host_port;
            result.port = default_port(result.scheme);
        }
    }

    if (result.host.empty()) {
        throw InvalidURL("Invalid URL, no host supplied: " + url);
    }
    std::transform(result.host.begin(), result.host.end(),
                   result.host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Everything after '#' stays on the client
    std::string rest = url.substr(host_end);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }

    size_t q = rest.find('?');
    if (q != std::string::npos) {
        result.path = rest.substr(0, q);
        result.query = rest.substr(q + 1);
    } else {
        result.path = rest;
    }
    if (result.path.empty()) {
        result.path = "/";
    }

    return result;
}

std::string URL::to_string() const {
    std::string result = scheme + "://";
    if (host.find(':') != std::string::npos) {
        result += "[" + host + "]";
    } else {
        result += host;
    }
    if (port != default_port(scheme)) {
        result += ":" + std::to_string(port);
    }
    result += target();
    return result;
}

std::string URL::target() const {
    if (query.empty()) {
        return path;
    }
    return path + "?" + query;
}

void URL::add_params(const QueryParams& params) {
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += "&";
        }
        query += percent_encode(key);
        query += "=";
        query += percent_encode(value);
    }
}

URL URL::resolve(const std::string& location) const {
    if (location.find("://") != std::string::npos) {
        return parse(location);
    }

    // Scheme-relative
    if (location.compare(0, 2, "//") == 0) {
        return parse(scheme + ":" + location);
    }

    URL result = *this;
    std::string ref = location;
    size_t hash = ref.find('#');
    if (hash != std::string::npos) {
        ref.erase(hash);
    }

    std::string ref_path = ref;
    std::string ref_query;
    size_t q = ref.find('?');
    if (q != std::string::npos) {
        ref_path = ref.substr(0, q);
        ref_query = ref.substr(q + 1);
    }

    if (ref_path.empty()) {
        // "?x=1" keeps the path
        result.query = q != std::string::npos ? ref_query : query;
    } else if (ref_path[0] == '/') {
        result.path = merge_paths("/", ref_path.substr(1));
        result.query = ref_query;
    } else {
        result.path = merge_paths(path, ref_path);
        result.query = ref_query;
    }
    return result;
}

std::string percent_encode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace volley
