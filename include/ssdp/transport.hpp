#ifndef SSDP_TRANSPORT_HPP
#define SSDP_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ssdp/headers.hpp"

namespace ssdp
{

struct datagram
{
    std::string payload;
    peer_info peer;
};

// Datagram carrier shared by the engine's send paths and the receive loop.
// send() and receive() may be called concurrently from different threads.
class transport
{
public:

    virtual ~transport() = default;

    // Throws socket_error on failure
    virtual void send(std::string_view addr, uint16_t port, std::string_view payload) = 0;

    // Waits at most timeout for one datagram truncated to max_size bytes
    virtual std::optional<datagram> receive(size_t max_size, std::chrono::milliseconds timeout) = 0;

    // Idempotent
    virtual void close() = 0;

    virtual bool closed() const = 0;
};

using transport_ptr = std::unique_ptr<transport>;

} // namespace ssdp

#endif
