#include "ssdp/message.hpp"
#include "ssdp/errors.hpp"

#include "fmt/format.h"

#include <type_traits>

namespace ssdp
{

static bool starts_with(std::string_view view, std::string_view prefix)
{
    return view.substr(0, prefix.size()) == prefix;
}

message classify(std::string_view raw, const peer_info& peer)
{
    std::string_view line = first_line(raw);

    if(starts_with(line, "NOTIFY *"))
        return notification::parse(raw, peer);
    else if(starts_with(line, "HTTP/"))
        return search_response::parse(raw, peer);
    else if(starts_with(line, "M-SEARCH *"))
        return search_request::parse(raw, peer);

    throw unknown_message_error {std::string {line}};
}

const std::string& message_target(const message& msg)
{
    return std::visit([](const auto& m) -> const std::string&
    {
        using T = std::decay_t<decltype(m)>;
        if constexpr(std::is_same_v<T, notification>)
            return m.type;
        else
            return m.target;
    }, msg);
}

const peer_info& message_peer(const message& msg)
{
    return std::visit([](const auto& m) -> const peer_info& { return m.peer; }, msg);
}

std::string unique_name(std::string_view target, const device& owner, const root_device& root)
{
    if(starts_with(target, "uuid:"))
        return owner.name;

    return fmt::format("{}::{}", root.name, target);
}

std::string server_string(const root_device& root)
{
    return fmt::format("SSDP/{} UPnP/1.0 {}/{}", SSDP_VERSION, root.kind, root.version);
}

} // namespace ssdp
