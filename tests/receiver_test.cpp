#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fake_transport.hpp"
#include "ssdp/receiver.hpp"

using namespace std::chrono_literals;

namespace
{

struct log_record
{
    ssdp::log_level level;
    std::string message;
};

class receiver_test : public ::testing::Test
{
protected:

    receiver_test()
        : m_net {std::make_shared<ssdp::test::fake_network>()},
          m_sock {m_net->factory()(ssdp::test::test_config())},
          m_queue {std::make_shared<ssdp::message_queue>()}
    {
        m_log.set_sink([this](ssdp::log_level level, std::string_view message)
        {
            std::lock_guard<std::mutex> lock {m_log_mutex};
            m_records.push_back(log_record {level, std::string {message}});
        });
    }

    std::vector<log_record> records()
    {
        std::lock_guard<std::mutex> lock {m_log_mutex};
        return m_records;
    }

    std::shared_ptr<ssdp::test::fake_network> m_net;

    ssdp::transport_ptr m_sock;

    ssdp::queue_ptr m_queue;

    ssdp::logger m_log;

    std::mutex m_log_mutex;

    std::vector<log_record> m_records;

};

} // namespace

TEST_F(receiver_test, survives_garbage_and_keeps_serving)
{
    ssdp::receiver recv {m_log, 10ms};
    recv.start(*m_sock, m_queue);

    m_net->inject("GARBAGE\r\n\r\n");
    m_net->inject("NOTIFY * HTTP/1.1\r\nNT: upnp:rootdevice\r\nNTS: ssdp:alive\r\nUSN: uuid:a\r\n\r\n", "10.0.0.5", 1900);

    std::optional<ssdp::message> msg = m_queue->pop();
    ASSERT_TRUE(msg.has_value());
    ASSERT_TRUE(std::holds_alternative<ssdp::notification>(*msg));
    EXPECT_EQ(std::get<ssdp::notification>(*msg).name, "uuid:a");
    EXPECT_EQ(std::get<ssdp::notification>(*msg).peer.host, "10.0.0.5");
    EXPECT_TRUE(recv.running());

    recv.stop();
    EXPECT_FALSE(recv.running());
    EXPECT_TRUE(m_queue->empty());

    std::vector<log_record> logged = records();
    bool warned = false, debugged = false;
    for(const auto& r : logged)
    {
        if(r.level == ssdp::log_level::warning && r.message.find("GARBAGE") != std::string::npos)
            warned = true;
        if(r.level == ssdp::log_level::debug && r.message == "SSDP recv NOTIFY 10.0.0.5:1900 upnp:rootdevice")
            debugged = true;
    }
    EXPECT_TRUE(warned);
    EXPECT_TRUE(debugged);
}

TEST_F(receiver_test, preserves_receipt_order)
{
    ssdp::receiver recv {m_log, 10ms};
    recv.start(*m_sock, m_queue);

    for(int i = 0; i < 3; i++)
        m_net->inject("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\nUSN: uuid:" + std::to_string(i) + "\r\n\r\n");

    for(int i = 0; i < 3; i++)
    {
        std::optional<ssdp::message> msg = m_queue->pop();
        ASSERT_TRUE(msg.has_value());
        EXPECT_EQ(std::get<ssdp::search_response>(*msg).name, "uuid:" + std::to_string(i));
    }
}

TEST_F(receiver_test, start_is_idempotent)
{
    ssdp::receiver recv {m_log, 10ms};
    auto other_queue = std::make_shared<ssdp::message_queue>();

    recv.start(*m_sock, m_queue);
    recv.start(*m_sock, other_queue);

    m_net->inject("M-SEARCH * HTTP/1.1\r\nST: ssdp:all\r\nMX: 1\r\n\r\n");

    std::optional<ssdp::message> msg = m_queue->pop();
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(std::holds_alternative<ssdp::search_request>(*msg));
    EXPECT_TRUE(other_queue->empty());
}

TEST_F(receiver_test, truncates_datagrams_to_read_size)
{
    ssdp::receiver recv {m_log, 10ms};
    recv.start(*m_sock, m_queue);

    std::string big = "NOTIFY * HTTP/1.1\r\nNT: upnp:rootdevice\r\nUSN: uuid:big\r\nX-PAD: " +
        std::string(2000, 'x') + "\r\n\r\n";
    m_net->inject(big);

    std::optional<ssdp::message> msg = m_queue->pop();
    ASSERT_TRUE(msg.has_value());
    const auto& n = std::get<ssdp::notification>(*msg);
    EXPECT_EQ(n.name, "uuid:big");
    EXPECT_LT(ssdp::get_header(n.headers, "X-PAD").size(), static_cast<size_t>(SSDP_DATAGRAM_SIZE));
}

TEST_F(receiver_test, stop_without_start)
{
    ssdp::receiver recv {m_log, 10ms};
    EXPECT_FALSE(recv.running());
    recv.stop();
    EXPECT_FALSE(recv.running());
}

TEST_F(receiver_test, backs_off_while_the_socket_fails)
{
    m_net->fail_receive(true);

    ssdp::receiver recv {m_log, 10ms};
    recv.start(*m_sock, m_queue);
    std::this_thread::sleep_for(200ms);

    size_t failures = 0;
    for(const auto& r : records())
    {
        if(r.level == ssdp::log_level::warning && r.message.find("Bad file descriptor") != std::string::npos)
            failures++;
    }
    EXPECT_GE(failures, 1u);
    EXPECT_LE(failures, 25u);
    EXPECT_TRUE(recv.running());

    m_net->fail_receive(false);
    m_net->inject("NOTIFY * HTTP/1.1\r\nNT: upnp:rootdevice\r\nNTS: ssdp:alive\r\nUSN: uuid:back\r\n\r\n");

    std::optional<ssdp::message> msg = m_queue->pop();
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(std::get<ssdp::notification>(*msg).name, "uuid:back");
}
