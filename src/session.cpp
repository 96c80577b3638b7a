#include "session.hpp"
#include "compression.hpp"
#include "connection_pool.hpp"
#include "errors.hpp"
#include "http_parser.hpp"
#include "logging.hpp"
#include "url.hpp"
#include <mbedtls/base64.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace volley {

namespace {

constexpr int kDefaultRedirectLimit = 30;

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string basic_auth(const Auth& auth) {
    std::string raw = auth.username + ":" + auth.password;
    std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
    size_t olen = 0;
    int ret = mbedtls_base64_encode(out.data(), out.size(), &olen,
                                    reinterpret_cast<const unsigned char*>(raw.data()),
                                    raw.size());
    if (ret != 0) {
        throw RequestException("Failed to encode credentials");
    }
    return "Basic " + std::string(out.begin(), out.begin() + olen);
}

bool method_has_body(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

} // namespace

class Session::Impl {
public:
    explicit Impl(SessionConfig config)
        : config_(std::move(config)),
          pool_(std::make_shared<ConnectionPool>(config_.max_connections, config_.idle_timeout)) {
    }

    Response request(const std::string& method, const std::string& url,
                     const RequestOptions& options);

    SessionConfig snapshot() const {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return config_;
    }

    mutable std::mutex config_mutex_;
    SessionConfig config_;

    // Shared with body readers that outlive a request() call
    std::shared_ptr<ConnectionPool> pool_;

private:
    Headers prepare_headers(const SessionConfig& cfg, const RequestOptions& options) const;

    std::string build_request(const std::string& method, const URL& url,
                              const Headers& headers,
                              const std::optional<std::string>& body) const;

    Response send_once(const std::string& method, const URL& url,
                       const Headers& headers, const std::optional<std::string>& body,
                       bool stream, bool verify, std::chrono::milliseconds timeout);
};

Headers Session::Impl::prepare_headers(const SessionConfig& cfg,
                                       const RequestOptions& options) const {
    Headers headers;
    headers.set("User-Agent", cfg.user_agent);
    headers.set("Accept-Encoding",
                cfg.compression ? Compression::get_accept_encoding_header() : "identity");
    headers.set("Accept", "*/*");
    headers.set("Connection", "keep-alive");

    headers.update(cfg.default_headers);
    if (options.headers) {
        headers.update(*options.headers);
    }

    if (options.auth && !headers.contains("Authorization")) {
        headers.set("Authorization", basic_auth(*options.auth));
    }
    return headers;
}

std::string Session::Impl::build_request(const std::string& method, const URL& url,
                                         const Headers& headers,
                                         const std::optional<std::string>& body) const {
    std::string result;
    result.reserve(512); // Pre-allocate

    // Request line
    result += method;
    result += " ";
    result += url.target();
    result += " HTTP/1.1\r\n";

    if (!headers.contains("Host")) {
        result += "Host: ";
        if (url.host.find(':') != std::string::npos) {
            result += "[" + url.host + "]";
        } else {
            result += url.host;
        }
        if ((url.scheme == "http" && url.port != 80) ||
            (url.scheme == "https" && url.port != 443)) {
            result += ":";
            result += std::to_string(url.port);
        }
        result += "\r\n";
    }

    headers.for_each([&](const std::string& key, const std::string& value) {
        // Framing is ours to decide
        std::string lower_key = key;
        std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower_key == "content-length" || lower_key == "transfer-encoding") {
            return;
        }
        result += key;
        result += ": ";
        result += value;
        result += "\r\n";
    });

    if (body) {
        result += "Content-Length: ";
        result += std::to_string(body->size());
        result += "\r\n";
    } else if (method_has_body(method)) {
        result += "Content-Length: 0\r\n";
    }

    result += "\r\n";
    return result;
}

Response Session::Impl::send_once(const std::string& method, const URL& url,
                                  const Headers& headers,
                                  const std::optional<std::string>& body,
                                  bool stream, bool verify,
                                  std::chrono::milliseconds timeout) {
    std::string head = build_request(method, url, headers, body);
    bool use_tls = url.is_tls();

    std::unique_ptr<WireReader> reader;
    ResponseHead response_head;

    for (int attempt = 0;; ++attempt) {
        auto conn = attempt == 0 ? pool_->acquire(url.host, url.port, use_tls, verify) : nullptr;
        bool reused = conn != nullptr;
        if (conn) {
            conn->set_timeout(timeout);
            log_debug() << "Reusing connection to " << url.host << ":" << url.port;
        } else {
            conn = pool_->open(url.host, url.port, use_tls, verify, timeout);
        }

        reader = std::make_unique<WireReader>(std::move(conn));
        try {
            reader->connection().send_all(head.data(), head.size());
            if (body && !body->empty()) {
                reader->connection().send_all(body->data(), body->size());
            }
            response_head = read_response_head(*reader);
            break;
        } catch (const ConnectionError&) {
            // The server dropped an idle keep-alive connection; dial once more
            if (reused && reader->bytes_received() == 0) {
                log_debug() << "Pooled connection to " << url.host << " went stale, reconnecting";
                continue;
            }
            throw;
        }
    }

    Response resp;
    resp.status_code = response_head.status_code;
    resp.reason = response_head.reason;
    resp.headers = response_head.headers;
    resp.url = url.to_string();

    size_t content_length = 0;
    BodyFraming framing = body_framing(method, response_head, content_length);

    std::unique_ptr<Decoder> decoder;
    if (framing != BodyFraming::None) {
        auto encoding = response_head.headers.get("Content-Encoding");
        if (encoding) {
            decoder = Compression::make_decoder(Compression::detect_from_header(*encoding));
            resp.was_compressed = decoder != nullptr;
        }
    }

    std::weak_ptr<ConnectionPool> weak_pool = pool_;
    std::string host = url.host;
    int port = url.port;
    auto body_reader = std::make_shared<WireBodyReader>(
        std::move(reader), framing, content_length, std::move(decoder),
        response_head.keep_alive(),
        [weak_pool, host, port, verify](std::unique_ptr<Connection> done) {
            if (auto pool = weak_pool.lock()) {
                pool->release(host, port, verify, std::move(done));
            }
        });

    resp.set_body_reader(std::move(body_reader));
    if (!stream || framing == BodyFraming::None) {
        resp.content();
    }
    return resp;
}

Response Session::Impl::request(const std::string& method_in, const std::string& url_str,
                                const RequestOptions& options) {
    auto start = std::chrono::steady_clock::now();
    SessionConfig cfg = snapshot();

    std::string method = upper(method_in);
    URL url = URL::parse(url_str);
    if (options.params) {
        url.add_params(*options.params);
    }

    Headers headers = prepare_headers(cfg, options);
    std::optional<std::string> body = options.data;
    bool stream = options.stream.value_or(false);
    bool verify = options.verify.value_or(cfg.verify);
    auto timeout = options.timeout.value_or(cfg.timeout);
    bool allow_redirects = options.allow_redirects.value_or(true);
    int max_redirects = options.max_redirects.value_or(kDefaultRedirectLimit);

    std::vector<Response> history;
    while (true) {
        Response resp = send_once(method, url, headers, body, stream, verify, timeout);

        if (!allow_redirects || !resp.is_redirect()) {
            resp.history = std::move(history);
            resp.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            for (const auto& hook : options.hooks.response) {
                if (hook) {
                    hook(resp);
                }
            }
            return resp;
        }

        if (static_cast<int>(history.size()) >= max_redirects) {
            throw TooManyRedirects("Exceeded " + std::to_string(max_redirects) + " redirects");
        }

        URL next = url.resolve(*resp.headers.get("Location"));

        // Drain so the connection can be reused
        resp.content();

        int code = resp.status_code;
        if ((code == 303 && method != "HEAD") ||
            ((code == 301 || code == 302) && method == "POST")) {
            method = "GET";
            body.reset();
            headers.erase("Content-Type");
        }

        // Credentials stay with the origin they were meant for
        if (next.host != url.host || next.port != url.port || next.scheme != url.scheme) {
            headers.erase("Authorization");
        }

        log_debug() << "Redirect " << code << " from " << url.to_string()
                    << " to " << next.to_string();
        history.push_back(std::move(resp));
        url = next;
    }
}

// Public API implementation

Session::Session() : Session(SessionConfig{}) {
}

Session::Session(SessionConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
}

Session::~Session() = default;

Response Session::request(const std::string& method, const std::string& url,
                          const RequestOptions& options) {
    return impl_->request(method, url, options);
}

Response Session::get(const std::string& url, const RequestOptions& options) {
    return impl_->request("GET", url, options);
}

Response Session::post(const std::string& url, const std::string& data,
                       const RequestOptions& options) {
    RequestOptions with_body = options;
    with_body.data = data;
    return impl_->request("POST", url, with_body);
}

void Session::set_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex_);
    impl_->config_.timeout = timeout;
}

void Session::set_user_agent(const std::string& ua) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex_);
    impl_->config_.user_agent = ua;
}

void Session::set_max_connections(int max) {
    {
        std::lock_guard<std::mutex> lock(impl_->config_mutex_);
        impl_->config_.max_connections = max;
    }
    impl_->pool_->set_max_connections(max);
}

void Session::enable_compression(bool enable) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex_);
    impl_->config_.compression = enable;
}

void Session::set_verify(bool verify) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex_);
    impl_->config_.verify = verify;
}

void Session::set_default_header(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(impl_->config_mutex_);
    impl_->config_.default_headers.set(name, value);
}

SessionConfig Session::config() const {
    return impl_->snapshot();
}

size_t Session::idle_connections() const {
    return impl_->pool_->idle_count();
}

} // namespace volley
