#ifndef SSDP_MESSAGE_HPP
#define SSDP_MESSAGE_HPP

#include <string>
#include <string_view>
#include <variant>

#include "ssdp/device.hpp"
#include "ssdp/headers.hpp"
#include "ssdp/notification.hpp"
#include "ssdp/search_request.hpp"
#include "ssdp/search_response.hpp"

#define SSDP_VERSION "0.1.0"

namespace ssdp
{

using message = std::variant<notification, search_response, search_request>;

// Parses a raw datagram according to its start line.
// Throws unknown_message_error if it is neither NOTIFY, M-SEARCH nor HTTP.
message classify(std::string_view raw, const peer_info& peer = {});

// NT of a notification, ST of a response or a search
const std::string& message_target(const message& msg);

const peer_info& message_peer(const message& msg);

// USN for a NOTIFY: the device name for uuid: targets, "<root name>::<target>" otherwise
std::string unique_name(std::string_view target, const device& owner, const root_device& root);

// SERVER header value "SSDP/<version> UPnP/1.0 <kind>/<root version>"
std::string server_string(const root_device& root);

} // namespace ssdp

#endif
