#include "connection_pool.hpp"
#include "errors.hpp"
#include "happy_eyeballs.hpp"
#include "logging.hpp"
#include "tls_connection.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>

// MSG_NOSIGNAL doesn't exist on some systems
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace volley {

Connection::Connection(int socket_fd)
    : last_used(std::chrono::steady_clock::now()),
      socket_fd_(socket_fd) {
}

Connection::~Connection() {
    // close_notify goes out before the socket closes
    tls_.reset();
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
    }
}

void Connection::set_timeout(std::chrono::milliseconds timeout) {
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void Connection::start_tls(const std::string& hostname, bool verify) {
    auto tls = std::make_unique<TLSConnection>(socket_fd_, hostname, verify);
    tls->handshake();
    tls_ = std::move(tls);
}

void Connection::send_all(const void* data, size_t len) {
    if (tls_) {
        tls_->send(data, len);
        return;
    }

    const char* buf = static_cast<const char*>(data);
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::send(socket_fd_, buf + written, len - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw Timeout("Write timed out");
            }
            throw ConnectionError(std::string("Send failed: ") + std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
}

size_t Connection::recv_some(void* data, size_t len) {
    if (tls_) {
        return tls_->recv(data, len);
    }

    while (true) {
        ssize_t n = ::recv(socket_fd_, data, len, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw ReadTimeout("Read timed out");
        }
        throw ConnectionError(std::string("Receive failed: ") + std::strerror(errno));
    }
}

bool Connection::is_alive() const {
    char buf[1];
    ssize_t ret = ::recv(socket_fd_, buf, 1, MSG_PEEK | MSG_DONTWAIT);
    return !(ret == 0 || (ret < 0 && errno != EAGAIN && errno != EWOULDBLOCK));
}

ConnectionPool::ConnectionPool(int max_connections, std::chrono::seconds idle_timeout)
    : max_connections_(max_connections), idle_timeout_(idle_timeout) {
}

ConnectionPool::~ConnectionPool() = default;

std::unique_ptr<Connection> ConnectionPool::open(
    const std::string& host, int port, bool use_tls, bool verify,
    std::chrono::milliseconds timeout) {

    HappyEyeballs he(host, port);
    auto conn = std::make_unique<Connection>(he.connect(timeout));
    conn->set_timeout(timeout);
    if (use_tls) {
        conn->start_tls(host, verify);
    }
    log_debug() << "Connected to " << host << ":" << port << (use_tls ? " (TLS)" : "");
    return conn;
}

std::unique_ptr<Connection> ConnectionPool::acquire(
    const std::string& host, int port, bool use_tls, bool verify) {

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = pools_.find(PoolKey{host, port, use_tls, verify});
    if (it == pools_.end()) {
        return nullptr;
    }

    // Most recently used first
    auto& pool = it->second;
    while (!pool.empty()) {
        auto conn = std::move(pool.back());
        pool.pop_back();

        auto idle = std::chrono::steady_clock::now() - conn->last_used;
        if (idle >= idle_timeout_ || !conn->is_alive()) {
            continue; // closed by destructor
        }
        return conn;
    }
    return nullptr;
}

void ConnectionPool::release(const std::string& host, int port, bool verify,
                             std::unique_ptr<Connection> conn) {
    if (!conn) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    evict_expired();

    size_t total_conns = 0;
    for (const auto& p : pools_) {
        total_conns += p.second.size();
    }
    if (total_conns >= static_cast<size_t>(std::max(max_connections_, 0))) {
        return;
    }

    conn->last_used = std::chrono::steady_clock::now();
    pools_[PoolKey{host, port, conn->is_tls(), verify}].push_back(std::move(conn));
}

// Caller holds mutex_
void ConnectionPool::evict_expired() {
    auto now = std::chrono::steady_clock::now();

    for (auto it = pools_.begin(); it != pools_.end();) {
        auto& pool = it->second;
        pool.erase(
            std::remove_if(pool.begin(), pool.end(),
                [&](const std::unique_ptr<Connection>& conn) {
                    return now - conn->last_used >= idle_timeout_;
                }),
            pool.end());
        it = pool.empty() ? pools_.erase(it) : std::next(it);
    }
}

void ConnectionPool::set_max_connections(int max_connections) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_connections_ = max_connections;
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& p : pools_) {
        total += p.second.size();
    }
    return total;
}

} // namespace volley
