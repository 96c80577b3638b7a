#ifndef VOLLEY_HAPPY_EYEBALLS_HPP
#define VOLLEY_HAPPY_EYEBALLS_HPP

#include <string>
#include <vector>
#include <chrono>
#include <sys/socket.h>
#include <netinet/in.h>
#include <poll.h>

namespace volley {

struct AddressInfo {
    int family;
    int socktype;
    int protocol;
    sockaddr_storage addr;
    socklen_t addrlen;
};

// RFC 8305 Happy Eyeballs v2 implementation
class HappyEyeballs {
public:
    static constexpr auto CONNECTION_ATTEMPT_DELAY = std::chrono::milliseconds(250);
    static constexpr auto RESOLUTION_DELAY = std::chrono::milliseconds(50);

    HappyEyeballs(const std::string& host, int port);

    // Returns the first connected socket, in blocking mode. Throws
    // ConnectionError when resolution fails or every address refuses, and
    // ConnectTimeout when the deadline passes first.
    int connect(std::chrono::milliseconds timeout);

private:
    std::string host_;
    int port_;
    std::vector<AddressInfo> ipv4_addrs_;
    std::vector<AddressInfo> ipv6_addrs_;
    int last_error_ = 0;
    bool timed_out_ = false;

    void resolve_addresses();
    int try_connect_parallel(const std::vector<AddressInfo>& addrs,
                             std::chrono::milliseconds timeout);
    int take_connected(std::vector<pollfd>& pending);
};

} // namespace volley

#endif // VOLLEY_HAPPY_EYEBALLS_HPP
