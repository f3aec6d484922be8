#ifndef SSDP_ERRORS_HPP
#define SSDP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ssdp
{

// Socket setup, option or send failure. Fatal to the running operating mode.
class socket_error : public std::runtime_error
{
public:
    explicit socket_error(const std::string& what)
        : std::runtime_error {what}
    {}
};

// Datagram that is neither NOTIFY, M-SEARCH nor an HTTP response
class unknown_message_error : public std::invalid_argument
{
public:
    explicit unknown_message_error(const std::string& first_line)
        : std::invalid_argument {"Unknown message " + first_line},
          m_first_line {first_line}
    {}

    const std::string& first_line() const
    {
        return m_first_line;
    }

private:

    std::string m_first_line;

};

class config_error : public std::runtime_error
{
public:
    explicit config_error(const std::string& what)
        : std::runtime_error {what}
    {}
};

} // namespace ssdp

#endif
