#pragma once

#include <string>
#include <utility>
#include <vector>

namespace volley {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct URL {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path;
    std::string query;

    // Throws MissingSchema, InvalidSchema or InvalidURL.
    static URL parse(const std::string& url);

    std::string to_string() const;

    // "path?query", as written on the request line
    std::string target() const;

    bool is_tls() const { return scheme == "https"; }

    // Percent-encodes each pair and appends it to the query.
    void add_params(const QueryParams& params);

    // Resolves a Location header value against this URL.
    URL resolve(const std::string& location) const;
};

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string percent_encode(const std::string& value);

} // namespace volley
