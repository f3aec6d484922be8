#include "ssdp/search_response.hpp"

#include "fmt/format.h"

namespace ssdp
{

search_response search_response::parse(std::string_view raw, const peer_info& peer)
{
    search_response res;
    res.headers = parse_headers(raw);
    res.target = get_header(res.headers, "ST");
    res.name = get_header(res.headers, "USN");
    res.location = get_header(res.headers, "LOCATION");
    res.server = get_header(res.headers, "SERVER");
    res.ext = res.headers.find("EXT") != res.headers.end();
    res.max_age = parse_max_age(get_header(res.headers, "CACHE-CONTROL"));
    res.peer = peer;
    return res;
}

std::string build_response(std::string_view location, std::string_view target, std::string_view name,
    std::string_view server)
{
    return fmt::format(
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=120\r\n"
        "EXT:\r\n"
        "LOCATION: {}\r\n"
        "SERVER: {}\r\n"
        "ST: {}\r\n"
        "NTS: ssdp:alive\r\n"
        "USN: {}\r\n"
        "Content-Length: 0\r\n"
        "\r\n",
        location, server, target, name);
}

} // namespace ssdp
