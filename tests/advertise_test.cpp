#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "fake_transport.hpp"
#include "ssdp/engine.hpp"
#include "ssdp/errors.hpp"

using namespace std::chrono_literals;

namespace
{

const std::vector<std::string> hosts {"10.0.0.2", "10.0.0.3"};

ssdp::root_device make_root()
{
    ssdp::root_device root;
    root.name = "uuid:root-1";
    root.type_urn = "urn:schemas-upnp-org:device:MediaServer:1";
    root.version = "1.0";
    root.kind = "MediaServer";

    root.devices.push_back(ssdp::device {"uuid:printer-1", "urn:schemas-upnp-org:device:Printer:1", {}, {}});
    root.devices.push_back(ssdp::device {"uuid:printer-2", "urn:schemas-upnp-org:device:Printer:1", {}, {}});
    root.devices.push_back(ssdp::device {"uuid:scanner-1", "urn:schemas-upnp-org:device:Scanner:1", {}, {}});

    root.services.push_back(ssdp::service {"urn:schemas-upnp-org:service:ContentDirectory:1"});
    root.services.push_back(ssdp::service {"urn:schemas-upnp-org:service:ConnectionManager:1"});
    return root;
}

std::string search_for(const std::string& target)
{
    return ssdp::build_search("239.255.255.250", 1900, target, 1);
}

size_t count_containing(const std::vector<std::string>& messages, const std::string& needle)
{
    size_t count = 0;
    for(const auto& m : messages)
    {
        if(m.find(needle) != std::string::npos)
            count++;
    }
    return count;
}

class advertise_test : public ::testing::Test
{
protected:

    advertise_test()
        : m_net {std::make_shared<ssdp::test::fake_network>()},
          m_engine {ssdp::test::test_config(), m_net->factory()},
          m_root {make_root()}
    {}

    ~advertise_test() override
    {
        if(m_running.valid())
        {
            m_engine.cancel();
            m_running.wait();
        }
    }

    void start()
    {
        m_running = std::async(std::launch::async, [this]()
        {
            m_engine.advertise(m_root, 8080, hosts);
        });

        // One full NOTIFY cycle: 1 + 2 * devices + services per host
        ASSERT_TRUE(m_net->wait_for_sent("NOTIFY", notify_cycle_size()));
    }

    void stop()
    {
        m_engine.cancel();
        ASSERT_EQ(m_running.wait_for(5s), std::future_status::ready);
        m_running.get();
    }

    size_t notify_cycle_size() const
    {
        return hosts.size() * (1 + 2 * m_root.devices.size() + m_root.services.size());
    }

    std::shared_ptr<ssdp::test::fake_network> m_net;

    ssdp::engine m_engine;

    ssdp::root_device m_root;

    std::future<void> m_running;

};

} // namespace

TEST_F(advertise_test, notify_cycle_covers_root_devices_and_services)
{
    start();
    stop();

    std::vector<std::string> notifies = m_net->sent_starting_with("NOTIFY");
    ASSERT_EQ(notifies.size(), notify_cycle_size());

    EXPECT_EQ(notifies[0],
        "NOTIFY * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "CACHE-CONTROL: max-age=120\r\n"
        "LOCATION: http://10.0.0.2:8080/description\r\n"
        "NT: upnp:rootdevice\r\n"
        "NTS: ssdp:alive\r\n"
        "SERVER: SSDP/" SSDP_VERSION " UPnP/1.0 MediaServer/1.0\r\n"
        "USN: uuid:root-1::upnp:rootdevice\r\n"
        "\r\n");

    EXPECT_EQ(count_containing(notifies, "LOCATION: http://10.0.0.2:8080/description\r\n"), notify_cycle_size() / 2);
    EXPECT_EQ(count_containing(notifies, "LOCATION: http://10.0.0.3:8080/description\r\n"), notify_cycle_size() / 2);
    EXPECT_EQ(count_containing(notifies, "NT: upnp:rootdevice\r\n"), 2u);
    EXPECT_EQ(count_containing(notifies, "NT: uuid:printer-1\r\nNTS: ssdp:alive\r\nSERVER: SSDP/" SSDP_VERSION
        " UPnP/1.0 MediaServer/1.0\r\nUSN: uuid:printer-1\r\n"), 2u);
    EXPECT_EQ(count_containing(notifies, "USN: uuid:root-1::urn:schemas-upnp-org:device:Printer:1\r\n"), 4u);
    EXPECT_EQ(count_containing(notifies, "NT: urn:schemas-upnp-org:service:ContentDirectory:1\r\n"), 2u);
}

TEST_F(advertise_test, answers_root_device_search_once_per_host)
{
    start();

    m_net->inject(search_for("upnp:rootdevice"), "10.0.0.50", 50000);
    ASSERT_TRUE(m_net->wait_for_sent("HTTP/1.1 200 OK", hosts.size()));
    stop();

    std::vector<std::string> responses = m_net->sent_starting_with("HTTP/1.1 200 OK");
    ASSERT_EQ(responses.size(), hosts.size());

    EXPECT_EQ(responses[0],
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=120\r\n"
        "EXT:\r\n"
        "LOCATION: http://10.0.0.2:8080/description\r\n"
        "SERVER: SSDP/" SSDP_VERSION " UPnP/1.0 MediaServer/1.0\r\n"
        "ST: upnp:rootdevice\r\n"
        "NTS: ssdp:alive\r\n"
        "USN: uuid:root-1::upnp:rootdevice\r\n"
        "Content-Length: 0\r\n"
        "\r\n");
    EXPECT_NE(responses[1].find("LOCATION: http://10.0.0.3:8080/description\r\n"), std::string::npos);
}

TEST_F(advertise_test, answers_device_search_per_matching_device_and_host)
{
    start();

    m_net->inject(search_for("urn:schemas-upnp-org:device:Printer:1"));
    ASSERT_TRUE(m_net->wait_for_sent("HTTP/1.1 200 OK", 4));
    stop();

    std::vector<std::string> responses = m_net->sent_starting_with("HTTP/1.1 200 OK");
    ASSERT_EQ(responses.size(), 4u);
    EXPECT_EQ(count_containing(responses, "USN: uuid:printer-1::urn:schemas-upnp-org:device:Printer:1\r\n"), 2u);
    EXPECT_EQ(count_containing(responses, "USN: uuid:printer-2::urn:schemas-upnp-org:device:Printer:1\r\n"), 2u);
    EXPECT_EQ(count_containing(responses, "ST: urn:schemas-upnp-org:device:Printer:1\r\n"), 4u);
}

TEST_F(advertise_test, ignores_unhandled_targets)
{
    std::vector<std::string> warnings;
    std::mutex mutex;
    m_engine.set_log_sink([&warnings, &mutex](ssdp::log_level level, std::string_view message)
    {
        std::lock_guard<std::mutex> lock {mutex};
        if(level == ssdp::log_level::warning)
            warnings.emplace_back(message);
    });

    start();

    m_net->inject(search_for("urn:schemas-upnp-org:service:ContentDirectory:1"));
    m_net->inject(search_for("urn:schemas-upnp-org:deviceXYZ"));
    m_net->inject(search_for("urn:schemas-upnp-org:device:Printer:1"));

    // The device search comes last, once it is answered the others were handled
    ASSERT_TRUE(m_net->wait_for_sent("HTTP/1.1 200 OK", 4));
    stop();

    EXPECT_EQ(m_net->sent_starting_with("HTTP/1.1 200 OK").size(), 4u);

    std::lock_guard<std::mutex> lock {mutex};
    EXPECT_EQ(count_containing(warnings, "Unhandled target urn:schemas-upnp-org:service:ContentDirectory:1"), 1u);
    EXPECT_EQ(count_containing(warnings, "Unhandled target urn:schemas-upnp-org:deviceXYZ"), 1u);
}

TEST_F(advertise_test, ignores_notifications_and_responses)
{
    start();

    m_net->inject("NOTIFY * HTTP/1.1\r\nNT: upnp:rootdevice\r\nNTS: ssdp:alive\r\nUSN: uuid:other\r\n\r\n");
    m_net->inject("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\nUSN: uuid:other\r\n\r\n");
    m_net->inject(search_for("upnp:rootdevice"));

    ASSERT_TRUE(m_net->wait_for_sent("HTTP/1.1 200 OK", hosts.size()));
    stop();

    EXPECT_EQ(m_net->sent_starting_with("HTTP/1.1 200 OK").size(), hosts.size());
}

TEST_F(advertise_test, cancel_releases_everything)
{
    start();
    EXPECT_TRUE(m_engine.socket_open());
    EXPECT_TRUE(m_engine.listening());

    stop();

    EXPECT_FALSE(m_engine.socket_open());
    EXPECT_FALSE(m_engine.listening());
    EXPECT_EQ(m_net->opened(), 1);
    EXPECT_EQ(m_net->closed(), 1);
}

TEST_F(advertise_test, notify_cycle_repeats_every_interval)
{
    m_engine.set_notify_interval(1s);
    start();

    ASSERT_TRUE(m_net->wait_for_sent("NOTIFY", 2 * notify_cycle_size()));
    stop();
}

TEST_F(advertise_test, socket_error_aborts_advertise)
{
    m_net->fail_send(true);

    auto running = std::async(std::launch::async, [this]()
    {
        m_engine.advertise(m_root, 8080, hosts);
    });

    ASSERT_EQ(running.wait_for(5s), std::future_status::ready);
    EXPECT_THROW(running.get(), ssdp::socket_error);
    EXPECT_FALSE(m_engine.socket_open());
    EXPECT_FALSE(m_engine.listening());
}

TEST_F(advertise_test, engine_is_reusable_after_advertise)
{
    start();
    stop();

    m_engine.byebye(m_root, {"10.0.0.2"});
    EXPECT_EQ(m_net->opened(), 2);
    EXPECT_FALSE(m_engine.socket_open());
}
