#include "ssdp/device_config.hpp"
#include "ssdp/errors.hpp"

#include "fmt/format.h"

#include <fstream>
#include <sstream>

namespace ssdp
{

static std::string required_string(const json& node, const char* key)
{
    if(!node.is_object() || !node.contains(key) || !node[key].is_string())
        throw config_error {fmt::format("Device entry needs a string \"{}\"", key)};

    std::string value = node[key].get<std::string>();
    if(value.empty())
        throw config_error {fmt::format("Device entry has an empty \"{}\"", key)};
    return value;
}

static void parse_device(const json& node, device& dest)
{
    dest.name = required_string(node, "name");
    dest.type_urn = required_string(node, "type_urn");

    if(node.contains("devices"))
    {
        if(!node["devices"].is_array())
            throw config_error {fmt::format("\"devices\" of {} is not an array", dest.name)};

        for(const auto& child : node["devices"])
            parse_device(child, dest.devices.emplace_back());
    }

    if(node.contains("services"))
    {
        if(!node["services"].is_array())
            throw config_error {fmt::format("\"services\" of {} is not an array", dest.name)};

        for(const auto& s : node["services"])
            dest.services.push_back(service {required_string(s, "type_urn")});
    }
}

root_device parse_root_device(const json& doc)
{
    root_device root;
    parse_device(doc, root);
    root.version = required_string(doc, "version");
    root.kind = doc.contains("kind") ? required_string(doc, "kind") : std::string {"Device"};
    return root;
}

root_device parse_root_device(const std::string& text)
{
    json doc;
    try {
        doc = json::parse(text);
    } catch(json::parse_error& e) {
        throw config_error {fmt::format("Invalid device description: {}", e.what())};
    }
    return parse_root_device(doc);
}

root_device load_root_device(const std::string& path)
{
    std::ifstream ifs {path};
    if(!ifs.good())
        throw config_error {fmt::format("Unable to open {}", path)};

    std::stringstream sstr;
    sstr << ifs.rdbuf();
    return parse_root_device(sstr.str());
}

} // namespace ssdp
