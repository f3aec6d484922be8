#include "ssdp/logging.hpp"

#include "fmt/format.h"

#include <cstdio>

namespace ssdp
{

std::string_view to_string(log_level level)
{
    switch(level)
    {
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warning:
            return "warning";
        case log_level::error:
            return "error";
    }
    return "unknown";
}

log_sink stderr_sink(log_level min_level)
{
    return [min_level](log_level level, std::string_view message)
    {
        if(level < min_level)
            return;

        fmt::print(stderr, "[{}] {}\n", to_string(level), message);
    };
}

} // namespace ssdp
