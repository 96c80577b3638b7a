#include "options.hpp"

namespace volley {

namespace {

template <typename T>
void take(std::optional<T>& into, const std::optional<T>& from) {
    if (from) {
        into = from;
    }
}

} // namespace

RequestOptions RequestOptions::merged_with(const RequestOptions& overrides) const {
    RequestOptions merged = *this;

    if (overrides.headers) {
        if (merged.headers) {
            merged.headers->update(*overrides.headers);
        } else {
            merged.headers = overrides.headers;
        }
    }

    take(merged.params, overrides.params);
    take(merged.data, overrides.data);
    take(merged.timeout, overrides.timeout);
    take(merged.auth, overrides.auth);
    take(merged.allow_redirects, overrides.allow_redirects);
    take(merged.max_redirects, overrides.max_redirects);
    take(merged.stream, overrides.stream);
    take(merged.verify, overrides.verify);

    merged.hooks.response.insert(merged.hooks.response.end(),
                                 overrides.hooks.response.begin(),
                                 overrides.hooks.response.end());
    return merged;
}

} // namespace volley
