#ifndef SSDP_MESSAGE_QUEUE_HPP
#define SSDP_MESSAGE_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "ssdp/message.hpp"

namespace ssdp
{

// Unbounded blocking FIFO carrying items from the receive loop to consumers.
// An empty optional in the queue is the shutdown sentinel.
template<typename T>
class basic_message_queue
{
public:

    basic_message_queue() = default;
    basic_message_queue(const basic_message_queue&) = delete;
    basic_message_queue& operator=(const basic_message_queue&) = delete;

    void push(T item)
    {
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            m_items.emplace_back(std::move(item));
        }
        m_cond.notify_one();
    }

    void push_shutdown()
    {
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            m_items.emplace_back(std::nullopt);
        }
        m_cond.notify_all();
    }

    // Blocks until an item is available. Returns std::nullopt for the shutdown sentinel.
    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lock {m_mutex};
        m_cond.wait(lock, [this]() { return !m_items.empty(); });

        std::optional<T> item = std::move(m_items.front());
        m_items.pop_front();
        return item;
    }

    // Non-blocking variant of pop(). Returns false if the queue is empty.
    bool try_pop(std::optional<T>& item)
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(m_items.empty())
            return false;

        item = std::move(m_items.front());
        m_items.pop_front();
        return true;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_items.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_items.size();
    }

private:

    mutable std::mutex m_mutex;

    std::condition_variable m_cond;

    std::deque<std::optional<T>> m_items;

};

using message_queue = basic_message_queue<message>;

using queue_ptr = std::shared_ptr<message_queue>;

} // namespace ssdp

#endif
