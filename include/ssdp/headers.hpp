#ifndef SSDP_HEADERS_HPP
#define SSDP_HEADERS_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ssdp
{

using header_map = std::map<std::string, std::string>;

// Sender of a received datagram
struct peer_info
{
    std::string host;
    uint16_t port = 0;

    bool operator==(const peer_info& other) const
    {
        return host == other.host && port == other.port;
    }
};

// Returns the first line of a datagram without its line terminator
std::string_view first_line(std::string_view raw);

// Parses the header block following the start line. Header names are kept as
// sent, values are stripped of surrounding whitespace. Parsing ends at the
// first empty line or at the end of the buffer.
header_map parse_headers(std::string_view raw);

// Returns the header value or an empty string
std::string get_header(const header_map& headers, const std::string& key);

// Extracts <n> from a "max-age=<n>" CACHE-CONTROL value
std::optional<unsigned int> parse_max_age(std::string_view cache_control);

} // namespace ssdp

#endif
