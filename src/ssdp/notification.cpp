#include "ssdp/notification.hpp"

#include "fmt/format.h"

namespace ssdp
{

notification notification::parse(std::string_view raw, const peer_info& peer)
{
    notification n;
    n.headers = parse_headers(raw);
    n.type = get_header(n.headers, "NT");
    n.status = get_header(n.headers, "NTS");
    n.name = get_header(n.headers, "USN");
    n.location = get_header(n.headers, "LOCATION");
    n.server = get_header(n.headers, "SERVER");
    n.max_age = parse_max_age(get_header(n.headers, "CACHE-CONTROL"));
    n.peer = peer;
    return n;
}

std::string build_notify(std::string_view broadcast, uint16_t port, std::string_view location,
    std::string_view type, std::string_view server, std::string_view name)
{
    return fmt::format(
        "NOTIFY * HTTP/1.1\r\n"
        "HOST: {}:{}\r\n"
        "CACHE-CONTROL: max-age=120\r\n"
        "LOCATION: {}\r\n"
        "NT: {}\r\n"
        "NTS: ssdp:alive\r\n"
        "SERVER: {}\r\n"
        "USN: {}\r\n"
        "\r\n",
        broadcast, port, location, type, server, name);
}

std::string build_notify_byebye(std::string_view broadcast, uint16_t port, std::string_view type,
    std::string_view name)
{
    return fmt::format(
        "NOTIFY * HTTP/1.1\r\n"
        "HOST: {}:{}\r\n"
        "NT: {}\r\n"
        "NTS: ssdp:byebye\r\n"
        "USN: {}\r\n"
        "\r\n",
        broadcast, port, type, name);
}

} // namespace ssdp
