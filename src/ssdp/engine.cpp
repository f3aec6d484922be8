#include "ssdp/engine.hpp"
#include "ssdp/errors.hpp"
#include "ssdp/multicast_socket.hpp"

#include "fmt/format.h"

#include <type_traits>
#include <utility>
#include <variant>

namespace ssdp
{

static bool starts_with(std::string_view view, std::string_view prefix)
{
    return view.substr(0, prefix.size()) == prefix;
}

static std::string description_location(std::string_view host, uint16_t port)
{
    return fmt::format("http://{}:{}/description", host, port);
}

// Device type targets look like urn:schemas-upnp-org:device:<type>:<version>
static bool is_device_target(std::string_view target)
{
    return starts_with(target, device_schema_prefix) && target.size() > device_schema_prefix.size() + 1 &&
        target[device_schema_prefix.size()] == ':';
}

std::optional<std::string> search_target::resolve() const
{
    switch(m_kind)
    {
        case kind::root:
            return std::string {root_device_target};
        case kind::device:
            return fmt::format("{}:{}", device_schema_prefix, m_value);
        case kind::service:
            return fmt::format("{}:{}", service_schema_prefix, m_value);
        case kind::raw:
            if(starts_with(m_value, "urn:") || starts_with(m_value, "uuid:") || starts_with(m_value, "ssdp:"))
                return m_value;
            break;
    }
    return std::nullopt;
}

transport_ptr open_multicast_socket(const engine_config& config)
{
    return multicast_socket::open(config.broadcast, config.port, config.ttl);
}

// Releases the receive loop and the socket when an operating mode returns or throws
class engine::session_guard
{
public:

    explicit session_guard(engine& e)
        : m_engine {e}
    {
        m_engine.begin_session();
    }

    session_guard(const session_guard&) = delete;
    session_guard& operator=(const session_guard&) = delete;

    ~session_guard()
    {
        m_engine.finish_session();
    }

private:

    engine& m_engine;

};

engine::engine(engine_config config, transport_factory factory)
    : m_config {std::move(config)},
      m_factory {std::move(factory)},
      m_receiver {m_log, m_config.poll_interval},
      m_queue {std::make_shared<message_queue>()}
{}

engine::engine(int ttl)
    : engine {}
{
    m_config.ttl = ttl;
}

engine::~engine()
{
    std::exception_ptr failure = stop_advertising();
    if(failure)
        m_log.error("SSDP engine destroyed with a failed advertise task");
}

std::vector<message> engine::search(const std::vector<search_target>& targets)
{
    session_guard guard {*this};
    socket();

    if(targets.empty())
    {
        send_search(all_target);
    }
    else
    {
        for(const auto& target : targets)
        {
            if(std::optional<std::string> st = target.resolve())
                send_search(*st);
        }
    }

    listen();
    wait_cancelled(m_config.timeout);

    return drain();
}

std::vector<message> engine::discover()
{
    session_guard guard {*this};
    socket();

    listen();
    wait_cancelled(m_config.timeout);

    return drain();
}

void engine::discover(const message_callback& callback)
{
    session_guard guard {*this};
    socket();

    listen();

    queue_ptr queue = current_queue();
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(m_cancelled)
            return;
    }

    while(std::optional<message> msg = queue->pop())
        callback(*msg);
}

void engine::advertise(const root_device& root, uint16_t port, const std::vector<std::string>& hosts)
{
    begin_session();

    try {
        socket();

        {
            std::lock_guard<std::mutex> lock {m_mutex};
            m_advertising = true;
            m_task_failed = false;
        }

        m_notify_loop = std::async(std::launch::async, [this, &root, port, &hosts]()
        {
            try {
                notify_loop(root, port, hosts);
            } catch(...) {
                task_failed();
                throw;
            }
        });

        listen();

        queue_ptr queue = current_queue();
        m_search_loop = std::async(std::launch::async, [this, queue, &root, port, &hosts]()
        {
            try {
                respond_loop(queue, root, port, hosts);
            } catch(...) {
                task_failed();
                throw;
            }
        });

        std::unique_lock<std::mutex> lock {m_mutex};
        m_cond.wait(lock, [this]() { return m_cancelled || m_task_failed; });
    } catch(...) {
        if(stop_advertising())
            m_log.error("SSDP advertise task failed during shutdown");
        throw;
    }

    std::exception_ptr failure = stop_advertising();
    if(failure)
        std::rethrow_exception(failure);
}

void engine::byebye(const root_device& root, const std::vector<std::string>& hosts)
{
    session_guard guard {*this};
    socket();

    for([[maybe_unused]] const auto& host : hosts)
    {
        send_notify_byebye(root_device_target, root, root);

        for(const auto& d : root.devices)
        {
            send_notify_byebye(d.name, d, root);
            send_notify_byebye(d.type_urn, d, root);
        }

        for(const auto& s : root.services)
            send_notify_byebye(s.type_urn, root, root);
    }
}

void engine::cancel()
{
    queue_ptr queue;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(!m_active)
            return;

        m_cancelled = true;
        queue = m_queue;
    }
    m_cond.notify_all();
    queue->push_shutdown();
}

void engine::send_search(std::string_view target)
{
    std::string msg = build_search(m_config.broadcast, m_config.port, target,
        static_cast<unsigned int>(m_config.timeout.count()));

    m_log.debug(fmt::format("SSDP sent M-SEARCH {}", target));
    socket().send(m_config.broadcast, m_config.port, msg);
}

void engine::send_notify(std::string_view location, std::string_view type, const device& owner, const root_device& root)
{
    std::string msg = build_notify(m_config.broadcast, m_config.port, location, type, server_string(root),
        unique_name(type, owner, root));

    m_log.debug(fmt::format("SSDP sent NOTIFY {}", type));
    socket().send(m_config.broadcast, m_config.port, msg);
}

void engine::send_notify_byebye(std::string_view type, const device& owner, const root_device& root)
{
    std::string msg = build_notify_byebye(m_config.broadcast, m_config.port, type, unique_name(type, owner, root));

    m_log.debug(fmt::format("SSDP sent byebye {}", type));
    socket().send(m_config.broadcast, m_config.port, msg);
}

void engine::send_response(std::string_view location, std::string_view target, std::string_view name,
    const root_device& root)
{
    std::string msg = build_response(location, target, name, server_string(root));

    m_log.debug(fmt::format("SSDP sent M-SEARCH OK {}", target));
    socket().send(m_config.broadcast, m_config.port, msg);
}

transport& engine::socket()
{
    if(!m_socket || m_socket->closed())
    {
        m_socket = m_factory(m_config);
        if(!m_socket)
            throw socket_error {"Transport factory returned no socket"};
    }
    return *m_socket;
}

void engine::listen()
{
    m_receiver.start(socket(), current_queue());
}

void engine::stop_listening()
{
    m_receiver.stop();

    std::lock_guard<std::mutex> lock {m_mutex};
    m_queue = std::make_shared<message_queue>();
}

void engine::close_socket()
{
    if(m_socket)
        m_socket->close();
    m_socket.reset();
}

void engine::begin_session()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    m_active = true;
    m_cancelled = false;
}

void engine::finish_session()
{
    stop_listening();
    close_socket();

    std::lock_guard<std::mutex> lock {m_mutex};
    m_active = false;
    m_cancelled = false;
}

queue_ptr engine::current_queue() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_queue;
}

bool engine::wait_cancelled(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock {m_mutex};
    return m_cond.wait_for(lock, timeout, [this]() { return m_cancelled; });
}

std::vector<message> engine::drain()
{
    std::vector<message> messages;
    queue_ptr queue = current_queue();

    std::optional<message> item;
    while(queue->try_pop(item))
    {
        // Skip shutdown sentinels left by cancel()
        if(item)
            messages.push_back(std::move(*item));
    }

    return messages;
}

void engine::notify_loop(const root_device& root, uint16_t port, const std::vector<std::string>& hosts)
{
    for(;;)
    {
        for(const auto& host : hosts)
        {
            std::string location = description_location(host, port);

            send_notify(location, root_device_target, root, root);

            for(const auto& d : root.devices)
            {
                send_notify(location, d.name, d, root);
                send_notify(location, d.type_urn, d, root);
            }

            for(const auto& s : root.services)
                send_notify(location, s.type_urn, root, root);
        }

        std::unique_lock<std::mutex> lock {m_mutex};
        if(m_cond.wait_for(lock, m_config.notify_interval, [this]() { return !m_advertising; }))
            return;
    }
}

void engine::respond_loop(queue_ptr queue, const root_device& root, uint16_t port, const std::vector<std::string>& hosts)
{
    while(std::optional<message> msg = queue->pop())
    {
        std::visit([&](const auto& m)
        {
            using T = std::decay_t<decltype(m)>;
            if constexpr(std::is_same_v<T, search_request>)
                respond(m, root, port, hosts);
        }, *msg);
    }
}

void engine::respond(const search_request& search, const root_device& root, uint16_t port,
    const std::vector<std::string>& hosts)
{
    if(is_device_target(search.target))
    {
        for(const auto& d : root.devices)
        {
            if(d.type_urn != search.target)
                continue;

            for(const auto& host : hosts)
                send_response(description_location(host, port), search.target,
                    fmt::format("{}::{}", d.name, search.target), root);
        }
    }
    else if(search.target == root_device_target)
    {
        for(const auto& host : hosts)
            send_response(description_location(host, port), search.target,
                unique_name(search.target, root, root), root);
    }
    else
    {
        m_log.warning(fmt::format("Unhandled target {}", search.target));
    }
}

std::exception_ptr engine::stop_advertising()
{
    std::exception_ptr failure;

    // Wake the responder blocked on its queue before the receive loop swaps it out
    current_queue()->push_shutdown();
    stop_listening();

    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_advertising = false;
    }
    m_cond.notify_all();

    for(std::future<void>* task : {&m_notify_loop, &m_search_loop})
    {
        if(!task->valid())
            continue;

        try {
            task->get();
        } catch(...) {
            if(!failure)
                failure = std::current_exception();
        }
    }

    close_socket();

    std::lock_guard<std::mutex> lock {m_mutex};
    m_active = false;
    m_cancelled = false;
    m_task_failed = false;

    return failure;
}

void engine::task_failed()
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_task_failed = true;
    }
    m_cond.notify_all();
}

} // namespace ssdp
