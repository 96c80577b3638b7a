#ifndef VOLLEY_CONNECTION_POOL_HPP
#define VOLLEY_CONNECTION_POOL_HPP

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>

namespace volley {

class TLSConnection;

// One TCP connection, optionally wrapped in TLS. Closes the socket on destruction.
class Connection {
public:
    explicit Connection(int socket_fd);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Applies to every later send and recv
    void set_timeout(std::chrono::milliseconds timeout);

    // Runs the TLS handshake. Throws SSLError or ConnectTimeout.
    void start_tls(const std::string& hostname, bool verify);

    // Throws ConnectionError, or Timeout when the peer stops reading.
    void send_all(const void* data, size_t len);

    // 0 when the peer closed. Throws ReadTimeout or ConnectionError.
    size_t recv_some(void* data, size_t len);

    // False when an idle keep-alive connection was closed by the peer
    bool is_alive() const;

    bool is_tls() const { return tls_ != nullptr; }

    std::chrono::steady_clock::time_point last_used;

private:
    int socket_fd_;
    std::unique_ptr<TLSConnection> tls_;
};

// Idle keep-alive connections, keyed by origin. Thread-safe.
class ConnectionPool {
public:
    ConnectionPool(int max_connections = 100,
                   std::chrono::seconds idle_timeout = std::chrono::seconds(60));
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // An idle connection for the origin, or nullptr when none is left
    std::unique_ptr<Connection> acquire(const std::string& host, int port,
                                        bool use_tls, bool verify);

    // Dials a fresh connection. Throws ConnectionError, ConnectTimeout or SSLError.
    std::unique_ptr<Connection> open(const std::string& host, int port,
                                     bool use_tls, bool verify,
                                     std::chrono::milliseconds timeout);

    // Returns a connection for reuse. Connections idle past idle_timeout are
    // closed first, then this one is dropped if the pool is still full.
    void release(const std::string& host, int port, bool verify,
                 std::unique_ptr<Connection> conn);

    void set_max_connections(int max_connections);

    size_t idle_count() const;

private:
    void evict_expired();

    struct PoolKey {
        std::string host;
        int port;
        bool use_tls;
        bool verify;

        bool operator<(const PoolKey& other) const {
            if (host != other.host) return host < other.host;
            if (port != other.port) return port < other.port;
            if (use_tls != other.use_tls) return use_tls < other.use_tls;
            return verify < other.verify;
        }
    };

    int max_connections_;
    std::chrono::seconds idle_timeout_;
    std::map<PoolKey, std::vector<std::unique_ptr<Connection>>> pools_;
    mutable std::mutex mutex_;
};

} // namespace volley

#endif // VOLLEY_CONNECTION_POOL_HPP
