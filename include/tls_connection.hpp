#ifndef VOLLEY_TLS_CONNECTION_HPP
#define VOLLEY_TLS_CONNECTION_HPP

#include <memory>
#include <string>
#include <sys/types.h>

namespace volley {

// Client side of a TLS session over an already connected socket. The socket
// stays owned by the caller.
class TLSConnection {
public:
    TLSConnection(int socket_fd, const std::string& hostname, bool verify);
    ~TLSConnection();

    TLSConnection(const TLSConnection&) = delete;
    TLSConnection& operator=(const TLSConnection&) = delete;

    // Throws SSLError, or ConnectTimeout when the socket times out mid-handshake.
    void handshake();

    // Writes everything or throws ConnectionError.
    void send(const void* data, size_t len);

    // 0 means the peer closed the session. Throws ReadTimeout or ConnectionError.
    size_t recv(void* data, size_t len);

    void close();


private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    int socket_fd_;
    std::string hostname_;
    bool verify_;
    bool connected_;
};

} // namespace volley

#endif // VOLLEY_TLS_CONNECTION_HPP
