#ifndef SSDP_ENGINE_HPP
#define SSDP_ENGINE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ssdp/device.hpp"
#include "ssdp/logging.hpp"
#include "ssdp/message.hpp"
#include "ssdp/message_queue.hpp"
#include "ssdp/receiver.hpp"
#include "ssdp/transport.hpp"

#define SSDP_DEFAULT_BROADCAST "239.255.255.250"
#define SSDP_DEFAULT_PORT 1900
#define SSDP_DEFAULT_TTL 4
#define SSDP_DEFAULT_TIMEOUT 1
#define SSDP_NOTIFY_INTERVAL 60
#define SSDP_POLL_INTERVAL 100

namespace ssdp
{

constexpr std::string_view device_schema_prefix {"urn:schemas-upnp-org:device"};
constexpr std::string_view service_schema_prefix {"urn:schemas-upnp-org:service"};
constexpr std::string_view root_device_target {"upnp:rootdevice"};
constexpr std::string_view all_target {"ssdp:all"};

struct engine_config
{
    std::string broadcast {SSDP_DEFAULT_BROADCAST};
    uint16_t port = SSDP_DEFAULT_PORT;
    int ttl = SSDP_DEFAULT_TTL;
    std::chrono::seconds timeout {SSDP_DEFAULT_TIMEOUT};               /// Time to wait for responses, also sent as MX
    std::chrono::seconds notify_interval {SSDP_NOTIFY_INTERVAL};       /// Period of the advertise NOTIFY cycle
    std::chrono::milliseconds poll_interval {SSDP_POLL_INTERVAL};      /// Upper bound for stopping the receive loop
};

// Target of an M-SEARCH. Strings are used verbatim if they start with urn:, uuid: or ssdp:.
class search_target
{
public:

    enum class kind
    {
        root,
        device,
        service,
        raw
    };

    search_target(const char* target)
        : m_kind {kind::raw}, m_value {target}
    {}

    search_target(std::string target)
        : m_kind {kind::raw}, m_value {std::move(target)}
    {}

    static search_target root()
    {
        return search_target {kind::root, {}};
    }

    // "MediaServer:1" searches urn:schemas-upnp-org:device:MediaServer:1
    static search_target device(std::string type_version)
    {
        return search_target {kind::device, std::move(type_version)};
    }

    static search_target service(std::string type_version)
    {
        return search_target {kind::service, std::move(type_version)};
    }

    kind type() const
    {
        return m_kind;
    }

    const std::string& value() const
    {
        return m_value;
    }

    // ST string for this target or std::nullopt if it has an unsupported shape
    std::optional<std::string> resolve() const;

private:

    search_target(kind k, std::string value)
        : m_kind {k}, m_value {std::move(value)}
    {}

    kind m_kind;

    std::string m_value;

};

using transport_factory = std::function<transport_ptr(const engine_config&)>;

using message_callback = std::function<void(const message&)>;

// Opens a multicast_socket for the given configuration
transport_ptr open_multicast_socket(const engine_config& config);

// SSDP discovery engine. One engine owns at most one socket and one receive
// loop at a time; every operating mode releases both before it returns.
class engine
{
public:

    engine(const engine&) = delete;
    engine& operator=(const engine&) = delete;
    engine(engine&&) = delete;
    engine& operator=(engine&&) = delete;
    ~engine();

    explicit engine(engine_config config = {}, transport_factory factory = open_multicast_socket);

    explicit engine(int ttl);

    /// Operating modes

    // Sends one M-SEARCH per resolvable target (ssdp:all without targets), waits
    // for the timeout and returns the messages received meanwhile.
    std::vector<message> search(const std::vector<search_target>& targets = {});

    // Waits for the timeout and returns every message received meanwhile
    std::vector<message> discover();

    // Forwards every received message to callback until cancel() is called
    void discover(const message_callback& callback);

    // Announces the device tree every notify interval and answers searches for
    // it until cancel() is called or a socket error occurs
    void advertise(const root_device& root, uint16_t port, const std::vector<std::string>& hosts);

    // Sends ssdp:byebye for the root device, its devices and its services
    void byebye(const root_device& root, const std::vector<std::string>& hosts);

    // Wakes a blocked discover(callback) or advertise() call. Thread safe. Does
    // nothing while no operating mode is running.
    void cancel();

    /// Single message senders, the socket is opened on demand

    void send_search(std::string_view target);

    void send_notify(std::string_view location, std::string_view type, const device& owner, const root_device& root);

    void send_notify_byebye(std::string_view type, const device& owner, const root_device& root);

    void send_response(std::string_view location, std::string_view target, std::string_view name,
        const root_device& root);

    /// State and configuration

    bool listening() const
    {
        return m_receiver.running();
    }

    bool socket_open() const
    {
        return m_socket && !m_socket->closed();
    }

    void set_log_sink(log_sink sink)
    {
        m_log.set_sink(std::move(sink));
    }

    const engine_config& config() const { return m_config; }

    const std::string& broadcast() const { return m_config.broadcast; }
    void set_broadcast(std::string broadcast) { m_config.broadcast = std::move(broadcast); }

    uint16_t port() const { return m_config.port; }
    void set_port(uint16_t port) { m_config.port = port; }

    int ttl() const { return m_config.ttl; }
    void set_ttl(int ttl) { m_config.ttl = ttl; }

    std::chrono::seconds timeout() const { return m_config.timeout; }
    void set_timeout(std::chrono::seconds timeout) { m_config.timeout = timeout; }

    std::chrono::seconds notify_interval() const { return m_config.notify_interval; }
    void set_notify_interval(std::chrono::seconds interval) { m_config.notify_interval = interval; }

private:

    class session_guard;

    transport& socket();

    void listen();

    void stop_listening();

    void close_socket();

    void begin_session();

    void finish_session();

    queue_ptr current_queue() const;

    // Returns true if cancel() was called before the timeout expired
    bool wait_cancelled(std::chrono::milliseconds timeout);

    std::vector<message> drain();

    void notify_loop(const root_device& root, uint16_t port, const std::vector<std::string>& hosts);

    void respond_loop(queue_ptr queue, const root_device& root, uint16_t port, const std::vector<std::string>& hosts);

    void respond(const search_request& search, const root_device& root, uint16_t port,
        const std::vector<std::string>& hosts);

    std::exception_ptr stop_advertising();

    void task_failed();

    engine_config m_config;

    transport_factory m_factory;

    logger m_log;

    transport_ptr m_socket;

    receiver m_receiver;

    queue_ptr m_queue;

    std::future<void> m_notify_loop;

    std::future<void> m_search_loop;

    mutable std::mutex m_mutex;

    std::condition_variable m_cond;

    bool m_active = false;

    bool m_cancelled = false;

    bool m_advertising = false;

    bool m_task_failed = false;

};

} // namespace ssdp

#endif
