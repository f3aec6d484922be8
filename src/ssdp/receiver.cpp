#include "ssdp/receiver.hpp"
#include "ssdp/errors.hpp"

#include "fmt/format.h"

#include <exception>
#include <thread>

namespace ssdp
{

receiver::~receiver()
{
    stop();
}

bool receiver::running() const
{
    return m_loop.valid() && m_loop.wait_for(std::chrono::seconds {0}) != std::future_status::ready;
}

void receiver::start(transport& sock, queue_ptr queue)
{
    if(running())
        return;

    // Collect a loop that ended on its own before starting a new one
    if(m_loop.valid())
        stop();

    m_keep = true;
    m_loop = std::async(std::launch::async, [this, &sock, queue = std::move(queue)]()
    {
        run(sock, queue);
    });
}

void receiver::stop()
{
    m_keep = false;
    if(!m_loop.valid())
        return;

    try {
        m_loop.get();
    } catch(std::exception& e) {
        m_log.error(fmt::format("SSDP receive loop failed: {}", e.what()));
    }
}

void receiver::run(transport& sock, queue_ptr queue)
{
    while(m_keep)
    {
        std::optional<datagram> dgram;
        try {
            dgram = sock.receive(SSDP_DATAGRAM_SIZE, m_poll_interval);
        } catch(std::exception& e) {
            // A failing socket returns at once, wait before the next attempt
            m_log.warning(e.what());
            std::this_thread::sleep_for(m_poll_interval);
            continue;
        }

        if(!dgram)
            continue;

        try {
            handle(*dgram, *queue);
        } catch(std::exception& e) {
            m_log.warning(e.what());
        }
    }
}

void receiver::handle(const datagram& dgram, message_queue& queue) const
{
    message msg = classify(dgram.payload, dgram.peer);

    if(m_log.enabled())
    {
        std::string_view line = first_line(dgram.payload);
        std::string_view method = line.substr(0, line.find(' '));
        m_log.debug(fmt::format("SSDP recv {} {}:{} {}", method, dgram.peer.host, dgram.peer.port,
            message_target(msg)));
    }

    queue.push(std::move(msg));
}

} // namespace ssdp
