#include "ssdp/headers.hpp"

#include <algorithm>
#include <charconv>

namespace ssdp
{

static std::string_view trim(std::string_view view)
{
    while(!view.empty() && (view.front() == ' ' || view.front() == '\t'))
        view.remove_prefix(1);
    while(!view.empty() && (view.back() == ' ' || view.back() == '\t' || view.back() == '\r'))
        view.remove_suffix(1);
    return view;
}

std::string_view first_line(std::string_view raw)
{
    std::string_view line {raw.data(), std::min(raw.find('\n'), raw.size())};
    if(!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    return line;
}

header_map parse_headers(std::string_view raw)
{
    header_map headers;

    size_t endl = raw.find('\n');
    if(endl == std::string_view::npos)
        return headers;
    raw.remove_prefix(endl + 1);

    while(!raw.empty())
    {
        endl = raw.find('\n');
        std::string_view line {raw.data(), std::min(endl, raw.size())};
        raw.remove_prefix((endl == std::string_view::npos) ? raw.size() : endl + 1);

        if(!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if(line.empty())
            break;

        size_t sep = line.find(':');
        if(sep == std::string_view::npos)
            continue;

        // Repeated headers keep the first occurrence
        headers.emplace(std::string {trim(line.substr(0, sep))}, std::string {trim(line.substr(sep + 1))});
    }

    return headers;
}

std::string get_header(const header_map& headers, const std::string& key)
{
    auto it = headers.find(key);
    return (it != headers.end()) ? it->second : std::string {};
}

std::optional<unsigned int> parse_max_age(std::string_view cache_control)
{
    constexpr std::string_view token {"max-age"};

    size_t pos = cache_control.find(token);
    if(pos == std::string_view::npos)
        return std::nullopt;

    cache_control.remove_prefix(pos + token.size());
    cache_control = trim(cache_control);
    if(cache_control.empty() || cache_control.front() != '=')
        return std::nullopt;
    cache_control = trim(cache_control.substr(1));

    unsigned int max_age = 0;
    auto res = std::from_chars(cache_control.data(), cache_control.data() + cache_control.size(), max_age);
    if(res.ec != std::errc {})
        return std::nullopt;

    return max_age;
}

} // namespace ssdp
