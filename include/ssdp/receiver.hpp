#ifndef SSDP_RECEIVER_HPP
#define SSDP_RECEIVER_HPP

#include <atomic>
#include <chrono>
#include <future>

#include "ssdp/logging.hpp"
#include "ssdp/message_queue.hpp"
#include "ssdp/transport.hpp"

#define SSDP_DATAGRAM_SIZE 1024

namespace ssdp
{

// Background loop reading datagrams from a transport, classifying them and
// pushing the typed messages onto a queue
class receiver
{
public:

    receiver() = delete;
    receiver(const receiver&) = delete;
    receiver& operator=(const receiver&) = delete;
    receiver(receiver&&) = delete;
    receiver& operator=(receiver&&) = delete;
    ~receiver();

    receiver(const logger& log, std::chrono::milliseconds poll_interval)
        : m_log {log}, m_poll_interval {poll_interval}
    {}

    // Does nothing if the loop is already running
    void start(transport& sock, queue_ptr queue);

    // Stops the loop and waits for it to exit. The blocked read returns within
    // one poll interval.
    void stop();

    bool running() const;

private:

    void run(transport& sock, queue_ptr queue);

    void handle(const datagram& dgram, message_queue& queue) const;

    const logger& m_log;

    std::chrono::milliseconds m_poll_interval;

    std::atomic<bool> m_keep {false};

    std::future<void> m_loop;

};

} // namespace ssdp

#endif
