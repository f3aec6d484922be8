#ifndef SSDP_DEVICE_HPP
#define SSDP_DEVICE_HPP

#include <string>
#include <vector>

namespace ssdp
{

// Read-only view of the UPnP device tree announced by advertise() and byebye().
// The tree is owned by the caller and never modified by the engine.

struct service
{
    std::string type_urn;
};

struct device
{
    std::string name;       // UDN, e.g. uuid:...
    std::string type_urn;
    std::vector<device> devices;
    std::vector<service> services;
};

struct root_device : device
{
    std::string version;
    std::string kind;       // Used as "<kind>/<version>" in the SERVER header
};

} // namespace ssdp

#endif
