#ifndef SSDP_NETIF_HPP
#define SSDP_NETIF_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ssdp
{

// IPv4 addresses of all interfaces that are up and not loopback.
// Throws std::runtime_error if the interface list can't be read.
std::vector<std::string> local_ipv4_addrs();

// Port number in 1..65535, nullopt for anything else
std::optional<uint16_t> parse_port(std::string_view text);

} // namespace ssdp

#endif
