#include "ssdp/netif.hpp"

#include <array>
#include <charconv>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>
#include <netinet/in.h>

namespace ssdp
{

static const char* error_msg = "Unable to get local ip address";

std::vector<std::string> local_ipv4_addrs()
{
    ifaddrs* addrs;
    if(getifaddrs(&addrs))
        throw std::runtime_error {error_msg};

    std::vector<std::string> result;
    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;
        if(!(curr_addr->ifa_flags & IFF_UP) || (curr_addr->ifa_flags & IFF_LOOPBACK))
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in), host.data(), NI_MAXHOST, nullptr, 0,
            NI_NUMERICHOST);
        if(s != 0)
        {
            freeifaddrs(addrs);
            throw std::runtime_error {error_msg};
        }

        result.emplace_back(host.data());
    }

    freeifaddrs(addrs);
    return result;
}

std::optional<uint16_t> parse_port(std::string_view text)
{
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if(ec != std::errc {} || ptr != text.data() + text.size() || port == 0 || port > 65535)
        return std::nullopt;
    return static_cast<uint16_t>(port);
}

} // namespace ssdp
