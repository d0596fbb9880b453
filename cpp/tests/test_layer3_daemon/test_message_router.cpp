// tests/test_layer3_daemon/test_message_router.cpp
/**
 * @file test_message_router.cpp
 * @brief Outbound fan-out to matched peers and inbound routing to channels.
 */
#include "message_router.hpp"

#include "daemon_test_helpers.h"

#include <gtest/gtest.h>

using namespace walkie::daemon;
using namespace walkie::tests::daemon_helper;
using walkie::utils::EventLoop;

namespace
{
constexpr size_t kMaxMessage = 32;
} // namespace

class MessageRouterTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        bool done = false;
        m_channels.join("room", "s1", [&done] { done = true; });
        ASSERT_TRUE(m_loop.run_until([&done] { return done; }, kWaitTimeout));
        m_topic = m_channels.find("room")->topic_hex;
    }

    /// Connects a fake peer; when @p matched it announces the room's topic.
    std::shared_ptr<FakeConnection::Record> add_peer(const std::string &identity, bool matched)
    {
        auto record = std::make_shared<FakeConnection::Record>();
        auto conn = std::make_unique<FakeConnection>(identity, record);
        FakeConnection *raw = conn.get();
        m_peers.add_connection(std::move(conn));
        if (matched)
        {
            raw->inject(encode_hello({m_topic}, identity + "-id"));
        }
        record->writes.clear();
        return record;
    }

    EventLoop m_loop;
    ManualMesh m_mesh{m_loop};
    ChannelRegistry m_channels{m_loop, m_mesh, CryptoPolicy::minimal()};
    PeerRegistry m_peers{m_loop, m_channels, "local-id", 4096, kMaxMessage};
    MessageRouter m_router{m_channels, m_peers, "local-id", kMaxMessage};
    std::string m_topic;
};

// ============================================================================
// Outbound
// ============================================================================

TEST_F(MessageRouterTest, SendWithNoPeersDeliversToNobody)
{
    auto sent = m_router.send("room", "hello");
    ASSERT_TRUE(sent.is_ok());
    EXPECT_EQ(sent.content(), 0u);
}

TEST_F(MessageRouterTest, SendReachesOnlyMatchedWritablePeers)
{
    auto a = add_peer("peer-a", true);
    auto b = add_peer("peer-b", true);
    auto c = add_peer("peer-c", false);
    b->writable = false;

    auto sent = m_router.send("room", "hello");
    ASSERT_TRUE(sent.is_ok());
    EXPECT_EQ(sent.content(), 1u);

    ASSERT_EQ(a->writes.size(), 1u);
    EXPECT_TRUE(b->writes.empty());
    EXPECT_TRUE(c->writes.empty());

    const std::string &line = a->writes.front();
    ASSERT_EQ(line.back(), '\n');
    const json record = json::parse(line.substr(0, line.size() - 1));
    EXPECT_EQ(record.at("t"), "msg");
    EXPECT_EQ(record.at("topic"), m_topic);
    EXPECT_EQ(record.at("data"), "hello");
    EXPECT_EQ(record.at("id"), "local-id");
    EXPECT_GT(record.at("ts").get<int64_t>(), 0);
}

TEST_F(MessageRouterTest, SizeLimitIsInclusive)
{
    EXPECT_TRUE(m_router.send("room", std::string(kMaxMessage, 'x')).is_ok());

    auto sent = m_router.send("room", std::string(kMaxMessage + 1, 'x'));
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error(), DaemonError::MessageTooLarge);
}

TEST_F(MessageRouterTest, OversizedIsReportedBeforeMembership)
{
    auto sent = m_router.send("elsewhere", std::string(kMaxMessage + 1, 'x'));
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error(), DaemonError::MessageTooLarge);

    auto small = m_router.send("elsewhere", "x");
    ASSERT_TRUE(small.is_error());
    EXPECT_EQ(small.error(), DaemonError::NotInChannel);
}

// ============================================================================
// Inbound
// ============================================================================

TEST_F(MessageRouterTest, InboundIsBufferedWithSenderId)
{
    m_router.route_inbound("peer-a", MsgRecord{m_topic, "hi", "remote-instance", 42});

    auto drained = m_channels.drain("room");
    ASSERT_TRUE(drained.is_ok());
    ASSERT_EQ(drained.content().size(), 1u);
    EXPECT_EQ(drained.content()[0], (MessageEntry{"remote-instance", "hi", 42}));
}

TEST_F(MessageRouterTest, InboundWithoutIdUsesShortPeerIdentity)
{
    m_router.route_inbound("abcdef0123456789", MsgRecord{m_topic, "hi", "", 7});

    auto drained = m_channels.drain("room");
    ASSERT_TRUE(drained.is_ok());
    ASSERT_EQ(drained.content().size(), 1u);
    EXPECT_EQ(drained.content()[0].from, "abcdef01");
}

TEST_F(MessageRouterTest, InboundResolvesWaitingRead)
{
    Messages got;
    bool resolved = false;
    auto waiter = m_channels.add_waiter("room", std::chrono::seconds(5),
                                        [&](Messages msgs)
                                        {
                                            resolved = true;
                                            got = std::move(msgs);
                                        });
    ASSERT_TRUE(waiter.is_ok());

    m_router.route_inbound("peer-a", MsgRecord{m_topic, "now", "r", 1});
    EXPECT_TRUE(resolved);
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].data, "now");
    EXPECT_TRUE(m_channels.drain("room").content().empty());
}

TEST_F(MessageRouterTest, InboundForUnknownTopicIsDropped)
{
    m_router.route_inbound("peer-a", MsgRecord{std::string(64, 'e'), "lost", "r", 1});
    EXPECT_TRUE(m_channels.drain("room").content().empty());
}

TEST_F(MessageRouterTest, PeerRecordsFlowThroughRouter)
{
    m_peers.set_message_handler([this](const std::string &identity, const MsgRecord &msg)
                                { m_router.route_inbound(identity, msg); });
    auto record = std::make_shared<FakeConnection::Record>();
    auto conn = std::make_unique<FakeConnection>("peer-z", record);
    FakeConnection *raw = conn.get();
    m_peers.add_connection(std::move(conn));

    raw->inject(encode_msg(m_topic, "via peer", "zed", 3));

    auto drained = m_channels.drain("room");
    ASSERT_TRUE(drained.is_ok());
    ASSERT_EQ(drained.content().size(), 1u);
    EXPECT_EQ(drained.content()[0].from, "zed");
    EXPECT_EQ(drained.content()[0].data, "via peer");
}
