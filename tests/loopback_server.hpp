#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace volley {
namespace test {

struct ReceivedRequest {
    std::string head;  // request line and headers
    std::string body;

    std::string request_line() const { return head.substr(0, head.find("\r\n")); }

    bool has_header_line(const std::string& line) const {
        return head.find("\r\n" + line + "\r\n") != std::string::npos;
    }
};

// Plain HTTP/1.1 server on 127.0.0.1 with an ephemeral port. The handler
// returns the raw bytes to write back; an empty string closes the connection.
class LoopbackServer {
public:
    using Handler = std::function<std::string(const ReceivedRequest&)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 64) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        acceptor_ = std::thread([this] { accept_loop(); });
    }

    ~LoopbackServer() {
        stop_ = true;
        acceptor_.join();
        ::close(listen_fd_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int fd : client_fds_) {
                ::shutdown(fd, SHUT_RDWR);
            }
        }
        for (auto& t : handlers_) {
            t.join();
        }
        for (int fd : client_fds_) {
            ::close(fd);
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    int port() const { return port_; }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    int connections_accepted() const { return accepted_.load(); }

    std::vector<ReceivedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    static std::string response(int status, const std::string& reason,
                                const std::string& body,
                                const std::vector<std::string>& extra_headers = {}) {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
        for (const auto& h : extra_headers) {
            out += h + "\r\n";
        }
        out += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
        out += body;
        return out;
    }

private:
    void accept_loop() {
        while (!stop_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                continue;
            }
            ++accepted_;
            std::lock_guard<std::mutex> lock(mutex_);
            client_fds_.push_back(fd);
            handlers_.emplace_back([this, fd] { serve(fd); });
        }
    }

    void serve(int fd) {
        std::string buffer;
        char chunk[4096];
        while (!stop_) {
            size_t head_end;
            while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
                ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
                if (n <= 0) {
                    ::shutdown(fd, SHUT_RDWR);
                    return;
                }
                buffer.append(chunk, static_cast<size_t>(n));
            }

            ReceivedRequest req;
            req.head = buffer.substr(0, head_end + 2);
            buffer.erase(0, head_end + 4);

            size_t length = 0;
            size_t cl = req.head.find("Content-Length: ");
            if (cl != std::string::npos) {
                length = std::stoul(req.head.substr(cl + 16));
            }
            while (buffer.size() < length) {
                ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
                if (n <= 0) {
                    ::shutdown(fd, SHUT_RDWR);
                    return;
                }
                buffer.append(chunk, static_cast<size_t>(n));
            }
            req.body = buffer.substr(0, length);
            buffer.erase(0, length);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                requests_.push_back(req);
            }

            std::string reply = handler_(req);
            if (reply.empty()) {
                break;
            }
            size_t sent = 0;
            while (sent < reply.size()) {
                ssize_t n = ::send(fd, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) {
                    ::shutdown(fd, SHUT_RDWR);
                    return;
                }
                sent += static_cast<size_t>(n);
            }
            // "X-Drop: 1" closes without telling the client
            if (reply.find("Connection: close") != std::string::npos ||
                reply.find("X-Drop: 1") != std::string::npos) {
                break;
            }
        }
        // Descriptors are closed by the destructor so their numbers are not reused
        ::shutdown(fd, SHUT_RDWR);
    }

    Handler handler_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::atomic<int> accepted_{0};
    std::thread acceptor_;
    mutable std::mutex mutex_;
    std::vector<int> client_fds_;
    std::vector<std::thread> handlers_;
    std::vector<ReceivedRequest> requests_;
};

} // namespace test
} // namespace volley
