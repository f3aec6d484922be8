#include "ssdp/multicast_socket.hpp"
#include "ssdp/errors.hpp"

#include "fmt/format.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

namespace ssdp
{

template<typename T>
static void set_option(int fd, int level, int name, const T& value, const char* option_name)
{
    if(setsockopt(fd, level, name, &value, sizeof(value)) != 0)
        throw socket_error {fmt::format("setsockopt {} failed: {}", option_name, std::strerror(errno))};
}

std::unique_ptr<multicast_socket> multicast_socket::open(const std::string& broadcast, uint16_t port, int ttl)
{
    std::unique_ptr<udp_socket> sock;
    try {
        sock = std::make_unique<udp_socket>();
    } catch(std::runtime_error& e) {
        throw socket_error {fmt::format("Unable to create socket: {}", e.what())};
    }

    const int fd = sock->get();

    ip_mreq membership {};
    if(inet_pton(AF_INET, broadcast.c_str(), &membership.imr_multiaddr) != 1)
        throw socket_error {fmt::format("Invalid broadcast address {}", broadcast)};
    membership.imr_interface.s_addr = htonl(INADDR_ANY);

    const int reuse = 1;
    const unsigned char loop = 0;

    set_option(fd, SOL_SOCKET, SO_REUSEADDR, reuse, "SO_REUSEADDR");
    set_option(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, membership, "IP_ADD_MEMBERSHIP");
    set_option(fd, IPPROTO_IP, IP_MULTICAST_LOOP, loop, "IP_MULTICAST_LOOP");
    set_option(fd, IPPROTO_IP, IP_MULTICAST_TTL, ttl, "IP_MULTICAST_TTL");
    set_option(fd, IPPROTO_IP, IP_TTL, ttl, "IP_TTL");

    try {
        sock->bind("0.0.0.0", port);
    } catch(std::runtime_error& e) {
        throw socket_error {fmt::format("Unable to bind 0.0.0.0:{}: {}", port, e.what())};
    }

    return std::unique_ptr<multicast_socket> {new multicast_socket {std::move(sock)}};
}

void multicast_socket::send(std::string_view addr, uint16_t port, std::string_view payload)
{
    if(!m_sock)
        throw socket_error {"Send on closed socket"};

    try {
        m_sock->send(addr, port, payload);
    } catch(std::runtime_error& e) {
        throw socket_error {fmt::format("Send to {}:{} failed: {}", addr, port, e.what())};
    }
}

std::optional<datagram> multicast_socket::receive(size_t max_size, std::chrono::milliseconds timeout)
{
    if(!m_sock)
        throw socket_error {"Receive on closed socket"};

    pollfd pfd {m_sock->get(), POLLIN, 0};
    int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if(ready < 0)
    {
        if(errno == EINTR)
            return std::nullopt;
        throw socket_error {fmt::format("poll failed: {}", std::strerror(errno))};
    }
    if(ready == 0 || !(pfd.revents & POLLIN))
        return std::nullopt;

    try {
        auto [buffer, peer] = m_sock->read<char>(max_size);
        return datagram {std::string {buffer.begin(), buffer.end()}, peer_info {peer.addr, peer.port}};
    } catch(std::runtime_error& e) {
        throw socket_error {fmt::format("Receive failed: {}", e.what())};
    }
}

} // namespace ssdp
