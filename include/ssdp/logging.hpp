#ifndef SSDP_LOGGING_HPP
#define SSDP_LOGGING_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

namespace ssdp
{

enum class log_level
{
    debug,
    info,
    warning,
    error
};

using log_sink = std::function<void(log_level, std::string_view)>;

std::string_view to_string(log_level level);

// Sink printing "[level] message" lines to stderr for levels >= min_level
log_sink stderr_sink(log_level min_level = log_level::info);

// Forwards messages to an optional sink. The sink may be replaced while other
// threads are logging.
class logger
{
public:

    logger() = default;

    explicit logger(log_sink sink)
        : m_sink {std::make_shared<const log_sink>(std::move(sink))}
    {}

    void set_sink(log_sink sink)
    {
        auto next = std::make_shared<const log_sink>(std::move(sink));
        std::lock_guard<std::mutex> lock {m_mutex};
        m_sink = std::move(next);
    }

    bool enabled() const
    {
        std::shared_ptr<const log_sink> sink = current();
        return sink && *sink;
    }

    void log(log_level level, std::string_view message) const
    {
        std::shared_ptr<const log_sink> sink = current();
        if(sink && *sink)
            (*sink)(level, message);
    }

    void debug(std::string_view message) const { log(log_level::debug, message); }

    void info(std::string_view message) const { log(log_level::info, message); }

    void warning(std::string_view message) const { log(log_level::warning, message); }

    void error(std::string_view message) const { log(log_level::error, message); }

private:

    std::shared_ptr<const log_sink> current() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_sink;
    }

    mutable std::mutex m_mutex;

    std::shared_ptr<const log_sink> m_sink;

};

} // namespace ssdp

#endif
