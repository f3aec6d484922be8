#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include <signal.h>
#include <unistd.h>

#include "fmt/format.h"

#include "ssdp/device_config.hpp"
#include "ssdp/engine.hpp"
#include "ssdp/errors.hpp"
#include "ssdp/netif.hpp"

#define DESCRIPTION_PORT 8080

static const char* usage =
    "usage: ssdp_tool search [root | device:<type:ver> | service:<type:ver> | urn:... | uuid:... | ssdp:...]...\n"
    "       ssdp_tool discover\n"
    "       ssdp_tool advertise <device.json> [description-port]\n"
    "       ssdp_tool byebye <device.json>\n";

static ssdp::search_target to_target(std::string_view arg)
{
    if(arg == "root")
        return ssdp::search_target::root();
    if(arg.substr(0, 7) == "device:")
        return ssdp::search_target::device(std::string {arg.substr(7)});
    if(arg.substr(0, 8) == "service:")
        return ssdp::search_target::service(std::string {arg.substr(8)});
    return ssdp::search_target {std::string {arg}};
}

static void print_message(const ssdp::message& msg)
{
    std::visit([](const auto& m)
    {
        using T = std::decay_t<decltype(m)>;
        if constexpr(std::is_same_v<T, ssdp::notification>)
            fmt::print("NOTIFY   {}:{} {} {} {} {}\n", m.peer.host, m.peer.port, m.status, m.type, m.name, m.location);
        else if constexpr(std::is_same_v<T, ssdp::search_response>)
            fmt::print("RESPONSE {}:{} {} {} {}\n", m.peer.host, m.peer.port, m.target, m.name, m.location);
        else
            fmt::print("M-SEARCH {}:{} {} MX={}\n", m.peer.host, m.peer.port, m.target, m.wait_time);
    }, msg);
}

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

// Runs a blocking engine call and cancels it on SIGINT or SIGTERM
template<typename Func>
static void run_until_signal(ssdp::engine& engine, Func&& func)
{
    sigset_t sigset;
    std::atomic<bool> done {false};
    block_signals(&sigset);
    std::future<int> signal_handler = std::async(std::launch::async, [&engine, &sigset, &done]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        if(!done.load())
        {
            fmt::print("Shutting down...\n");
            engine.cancel();
        }
        return signum;
    });

    try {
        func();
    } catch(...) {
        done.store(true);
        kill(getpid(), SIGTERM);
        signal_handler.get();
        throw;
    }

    done.store(true);
    kill(getpid(), SIGTERM);
    signal_handler.get();
}

static std::vector<std::string> advertise_hosts()
{
    std::vector<std::string> hosts = ssdp::local_ipv4_addrs();
    if(hosts.empty())
        throw std::runtime_error {"No network interface to advertise on"};
    return hosts;
}

int main(int argc, char* argv[])
{
    if(argc < 2)
    {
        fmt::print(stderr, "{}", usage);
        return EXIT_FAILURE;
    }

    std::string_view command {argv[1]};
    ssdp::engine engine;
    engine.set_log_sink(ssdp::stderr_sink(std::getenv("SSDP_DEBUG") ? ssdp::log_level::debug : ssdp::log_level::info));

    try {
        if(command == "search")
        {
            std::vector<ssdp::search_target> targets;
            for(int i = 2; i < argc; i++)
                targets.push_back(to_target(argv[i]));

            std::vector<ssdp::message> responses = engine.search(targets);
            fmt::print("Received {} message(s)\n", responses.size());
            for(const auto& msg : responses)
                print_message(msg);
        }
        else if(command == "discover")
        {
            run_until_signal(engine, [&engine]()
            {
                engine.discover(print_message);
            });
        }
        else if(command == "advertise" && argc >= 3)
        {
            ssdp::root_device root = ssdp::load_root_device(argv[2]);
            std::optional<uint16_t> port {DESCRIPTION_PORT};
            if(argc >= 4)
                port = ssdp::parse_port(argv[3]);
            if(!port)
            {
                fmt::print(stderr, "Invalid description port {}\n{}", argv[3], usage);
                return EXIT_FAILURE;
            }
            std::vector<std::string> hosts = advertise_hosts();

            fmt::print("Advertising {} on {} host(s), press Ctrl+C to stop\n", root.name, hosts.size());
            run_until_signal(engine, [&engine, &root, port = *port, &hosts]()
            {
                engine.advertise(root, port, hosts);
            });
            engine.byebye(root, hosts);
        }
        else if(command == "byebye" && argc >= 3)
        {
            ssdp::root_device root = ssdp::load_root_device(argv[2]);
            engine.byebye(root, advertise_hosts());
        }
        else
        {
            fmt::print(stderr, "{}", usage);
            return EXIT_FAILURE;
        }
    } catch(ssdp::config_error& e) {
        fmt::print(stderr, "Configuration error: {}\n", e.what());
        return EXIT_FAILURE;
    } catch(ssdp::socket_error& e) {
        fmt::print(stderr, "Socket error: {}\n", e.what());
        return EXIT_FAILURE;
    } catch(std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
