#ifndef SSDP_SEARCH_REQUEST_HPP
#define SSDP_SEARCH_REQUEST_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "ssdp/headers.hpp"

namespace ssdp
{

// M-SEARCH received while advertising
struct search_request
{
    std::string target;         /// ST
    unsigned int wait_time = 0; /// MX in seconds, 0 if missing or invalid
    std::string man;

    header_map headers;
    peer_info peer;

    static search_request parse(std::string_view raw, const peer_info& peer = {});
};

std::string build_search(std::string_view broadcast, uint16_t port, std::string_view target,
    unsigned int wait_time);

} // namespace ssdp

#endif
