#ifndef SSDP_SEARCH_RESPONSE_HPP
#define SSDP_SEARCH_RESPONSE_HPP

#include <optional>
#include <string>
#include <string_view>

#include "ssdp/headers.hpp"

namespace ssdp
{

// HTTP/1.1 200 OK answer to an M-SEARCH
struct search_response
{
    std::string target;     /// ST
    std::string name;       /// USN
    std::string location;
    std::string server;
    bool ext = false;       /// EXT header present
    std::optional<unsigned int> max_age;

    header_map headers;
    peer_info peer;

    static search_response parse(std::string_view raw, const peer_info& peer = {});
};

std::string build_response(std::string_view location, std::string_view target, std::string_view name,
    std::string_view server);

} // namespace ssdp

#endif
