#include "ssdp/search_request.hpp"

#include "fmt/format.h"

#include <charconv>

namespace ssdp
{

search_request search_request::parse(std::string_view raw, const peer_info& peer)
{
    search_request req;
    req.headers = parse_headers(raw);
    req.target = get_header(req.headers, "ST");
    req.man = get_header(req.headers, "MAN");
    req.peer = peer;

    std::string mx = get_header(req.headers, "MX");
    auto res = std::from_chars(mx.data(), mx.data() + mx.size(), req.wait_time);
    if(res.ec != std::errc {})
        req.wait_time = 0;

    return req;
}

std::string build_search(std::string_view broadcast, uint16_t port, std::string_view target,
    unsigned int wait_time)
{
    return fmt::format(
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: {}:{}\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: {}\r\n"
        "ST: {}\r\n"
        "\r\n",
        broadcast, port, wait_time, target);
}

} // namespace ssdp
