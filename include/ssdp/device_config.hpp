#ifndef SSDP_DEVICE_CONFIG_HPP
#define SSDP_DEVICE_CONFIG_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "ssdp/device.hpp"

namespace ssdp
{

using json = nlohmann::json;

// Device tree for advertise() from a JSON document of the form
// {"name": "uuid:...", "type_urn": "...", "version": "1.0", "kind": "...",
//  "devices": [{"name", "type_urn", "devices", "services"}], "services": [{"type_urn"}]}
// Throws config_error if the document is invalid.
root_device parse_root_device(const json& doc);

root_device parse_root_device(const std::string& text);

// Throws config_error if the file can't be read or parsed
root_device load_root_device(const std::string& path);

} // namespace ssdp

#endif
