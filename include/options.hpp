#pragma once

#include "response.hpp"
#include "url.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace volley {

using ResponseHook = std::function<void(Response&)>;

struct Hooks {
    // Run in order by the transport on every final response
    std::vector<ResponseHook> response;
};

// HTTP Basic credentials
struct Auth {
    std::string username;
    std::string password;
};

// Per-request settings. Unset fields fall back to the session's configuration.
struct RequestOptions {
    std::optional<Headers> headers;
    std::optional<QueryParams> params;
    std::optional<std::string> data;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<Auth> auth;
    std::optional<bool> allow_redirects;
    std::optional<int> max_redirects;

    // Return after the headers and read the body on demand
    std::optional<bool> stream;

    // Verify the server certificate
    std::optional<bool> verify;

    Hooks hooks;

    // Fields set in `overrides` win. Headers merge by name, hooks are concatenated.
    RequestOptions merged_with(const RequestOptions& overrides) const;
};

} // namespace volley
