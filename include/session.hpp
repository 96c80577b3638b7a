#pragma once

#include "options.hpp"
#include "response.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace volley {

// What the executor needs from an HTTP client. Implementations report every
// failure by throwing, RequestException subclasses for wire problems. One
// instance may be shared by several workers, so request() must be thread-safe.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Response request(const std::string& method, const std::string& url,
                             const RequestOptions& options) = 0;
};

struct SessionConfig {
    std::string user_agent = "volley/1.0";
    std::chrono::milliseconds timeout{30000};
    int max_connections = 100;
    std::chrono::seconds idle_timeout{60};
    bool compression = true;
    bool verify = true;

    // Sent with every request unless the request sets the same header
    Headers default_headers;
};

// HTTP/1.1 client with keep-alive connection reuse, TLS and content decoding.
class Session : public Transport {
public:
    Session();
    explicit Session(SessionConfig config);
    ~Session() override;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    Response request(const std::string& method, const std::string& url,
                     const RequestOptions& options) override;

    Response get(const std::string& url, const RequestOptions& options = {});
    Response post(const std::string& url, const std::string& data,
                  const RequestOptions& options = {});

    // Configuration
    void set_timeout(std::chrono::milliseconds timeout);
    void set_user_agent(const std::string& ua);
    void set_max_connections(int max);
    void enable_compression(bool enable);
    void set_verify(bool verify);
    void set_default_header(const std::string& name, const std::string& value);

    SessionConfig config() const;

    // Idle keep-alive connections currently held
    size_t idle_connections() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace volley
