#ifndef SSDP_NOTIFICATION_HPP
#define SSDP_NOTIFICATION_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ssdp/headers.hpp"

namespace ssdp
{

constexpr std::string_view status_alive {"ssdp:alive"};
constexpr std::string_view status_byebye {"ssdp:byebye"};

// NOTIFY announcement received from a device
struct notification
{
    std::string type;       /// NT
    std::string status;     /// NTS - ssdp:alive or ssdp:byebye
    std::string name;       /// USN
    std::string location;
    std::string server;
    std::optional<unsigned int> max_age;

    header_map headers;
    peer_info peer;

    bool alive() const
    {
        return status == status_alive;
    }

    bool byebye() const
    {
        return status == status_byebye;
    }

    static notification parse(std::string_view raw, const peer_info& peer = {});
};

std::string build_notify(std::string_view broadcast, uint16_t port, std::string_view location,
    std::string_view type, std::string_view server, std::string_view name);

std::string build_notify_byebye(std::string_view broadcast, uint16_t port, std::string_view type,
    std::string_view name);

} // namespace ssdp

#endif
