#include "happy_eyeballs.hpp"
#include "errors.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/tcp.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace volley {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds remaining_until(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

void set_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
}

} // namespace

HappyEyeballs::HappyEyeballs(const std::string& host, int port)
    : host_(host), port_(port) {
}

void HappyEyeballs::resolve_addresses() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    hints.ai_flags = AI_NUMERICSERV;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port_);

    int ret = getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &result);
    if (ret != 0) {
        throw ConnectionError("Failed to resolve '" + host_ + "': " + gai_strerror(ret));
    }

    // Separate IPv4 and IPv6 addresses
    for (struct addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
        AddressInfo addr;
        addr.family = rp->ai_family;
        addr.socktype = rp->ai_socktype;
        addr.protocol = rp->ai_protocol;
        addr.addrlen = rp->ai_addrlen;
        std::memcpy(&addr.addr, rp->ai_addr, rp->ai_addrlen);

        if (rp->ai_family == AF_INET6) {
            ipv6_addrs_.push_back(addr);
        } else if (rp->ai_family == AF_INET) {
            ipv4_addrs_.push_back(addr);
        }
    }

    freeaddrinfo(result);
    if (ipv4_addrs_.empty() && ipv6_addrs_.empty()) {
        throw ConnectionError("No usable address for '" + host_ + "'");
    }
}

int HappyEyeballs::take_connected(std::vector<pollfd>& pending) {
    for (size_t i = 0; i < pending.size();) {
        if ((pending[i].revents & (POLLOUT | POLLERR | POLLHUP)) == 0) {
            ++i;
            continue;
        }

        int error = 0;
        socklen_t len = sizeof(error);
        getsockopt(pending[i].fd, SOL_SOCKET, SO_ERROR, &error, &len);

        if (error == 0) {
            int success_fd = pending[i].fd;
            for (const auto& other : pending) {
                if (other.fd != success_fd) {
                    ::close(other.fd);
                }
            }
            pending.clear();
            set_blocking(success_fd);
            return success_fd;
        }

        last_error_ = error;
        ::close(pending[i].fd);
        pending.erase(pending.begin() + i);
    }
    return -1;
}

int HappyEyeballs::try_connect_parallel(const std::vector<AddressInfo>& addrs,
                                        std::chrono::milliseconds timeout) {
    std::vector<pollfd> pending;
    auto deadline = Clock::now() + timeout;

    // Stagger connection attempts
    for (size_t i = 0; i < addrs.size(); ++i) {
        const auto& addr = addrs[i];

        int fd = socket(addr.family, addr.socktype | SOCK_NONBLOCK, addr.protocol);
        if (fd < 0) {
            last_error_ = errno;
            continue;
        }

        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));

        int ret = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr.addr), addr.addrlen);
        if (ret == 0) {
            for (const auto& other : pending) {
                ::close(other.fd);
            }
            set_blocking(fd);
            return fd;
        }
        if (errno != EINPROGRESS) {
            last_error_ = errno;
            ::close(fd);
            continue;
        }

        pending.push_back(pollfd{fd, POLLOUT, 0});

        // Give this attempt a head start before the next address
        auto wait = std::min(remaining_until(deadline),
                             i + 1 < addrs.size() ? std::chrono::milliseconds(CONNECTION_ATTEMPT_DELAY)
                                                  : std::chrono::milliseconds(0));
        if (poll(pending.data(), pending.size(), static_cast<int>(wait.count())) > 0) {
            int connected = take_connected(pending);
            if (connected >= 0) {
                return connected;
            }
        }

        if (remaining_until(deadline).count() == 0) {
            break;
        }
    }

    // Wait for any connection to complete
    while (!pending.empty()) {
        auto remaining = remaining_until(deadline);
        if (remaining.count() == 0) {
            timed_out_ = true;
            break;
        }

        int poll_ret = poll(pending.data(), pending.size(), static_cast<int>(remaining.count()));
        if (poll_ret < 0 && errno != EINTR) {
            last_error_ = errno;
            break;
        }
        if (poll_ret == 0) {
            timed_out_ = true;
            break;
        }
        if (poll_ret > 0) {
            int connected = take_connected(pending);
            if (connected >= 0) {
                return connected;
            }
        }
    }

    for (const auto& p : pending) {
        ::close(p.fd);
    }
    return -1;
}

int HappyEyeballs::connect(std::chrono::milliseconds timeout) {
    resolve_addresses();

    auto deadline = Clock::now() + timeout;

    // RFC 8305: prefer IPv6, fall back to IPv4 soon after
    if (!ipv6_addrs_.empty()) {
        int fd = try_connect_parallel(ipv6_addrs_, std::min(timeout, std::chrono::milliseconds(RESOLUTION_DELAY)));
        if (fd >= 0) {
            return fd;
        }
    }

    if (!ipv4_addrs_.empty() && remaining_until(deadline).count() > 0) {
        timed_out_ = false;
        int fd = try_connect_parallel(ipv4_addrs_, remaining_until(deadline));
        if (fd >= 0) {
            return fd;
        }
    }

    // IPv6 gets the rest of the budget
    if (!ipv6_addrs_.empty() && remaining_until(deadline).count() > 0) {
        timed_out_ = false;
        int fd = try_connect_parallel(ipv6_addrs_, remaining_until(deadline));
        if (fd >= 0) {
            return fd;
        }
    }

    if (timed_out_ || remaining_until(deadline).count() == 0) {
        throw ConnectTimeout("Connection to " + host_ + ":" + std::to_string(port_) +
                             " timed out after " + std::to_string(timeout.count()) + " ms");
    }
    throw ConnectionError("Failed to connect to " + host_ + ":" + std::to_string(port_) + ": " +
                          std::strerror(last_error_ != 0 ? last_error_ : ECONNREFUSED));
}

} // namespace volley
