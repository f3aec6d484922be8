#ifndef SSDP_MULTICAST_SOCKET_HPP
#define SSDP_MULTICAST_SOCKET_HPP

#include <memory>
#include <string>

#include <socketwrapper.hpp>

#include "ssdp/transport.hpp"

namespace ssdp
{

// UDP socket joined to the SSDP multicast group and bound to 0.0.0.0:<port>
class multicast_socket : public transport
{
public:

    multicast_socket() = delete;
    multicast_socket(const multicast_socket&) = delete;
    multicast_socket& operator=(const multicast_socket&) = delete;
    multicast_socket(multicast_socket&&) = delete;
    multicast_socket& operator=(multicast_socket&&) = delete;
    ~multicast_socket() override = default;

    // Joins <broadcast> on interface 0.0.0.0, disables multicast loopback, sets the
    // multicast and unicast TTL and binds. Throws socket_error if any step fails.
    static std::unique_ptr<multicast_socket> open(const std::string& broadcast, uint16_t port, int ttl);

    void send(std::string_view addr, uint16_t port, std::string_view payload) override;

    std::optional<datagram> receive(size_t max_size, std::chrono::milliseconds timeout) override;

    void close() override
    {
        m_sock.reset();
    }

    bool closed() const override
    {
        return !m_sock;
    }

    // Underlying file descriptor, -1 once closed
    int native_handle() const
    {
        return m_sock ? m_sock->get() : -1;
    }

private:

    using udp_socket = net::udp_socket<net::ip_version::v4>;

    explicit multicast_socket(std::unique_ptr<udp_socket>&& sock)
        : m_sock {std::move(sock)}
    {}

    std::unique_ptr<udp_socket> m_sock;

};

} // namespace ssdp

#endif
