// tests/test_layer3_daemon/test_zmq_mesh.cpp
/**
 * @file test_zmq_mesh.cpp
 * @brief Curve keys on disk and ROUTER/DEALER links between two meshes on localhost.
 */
#include "zmq_mesh.hpp"

#include "daemon_test_helpers.h"

#include <gtest/gtest.h>
#include <zmq.h>

#include <sys/stat.h>

#include <fstream>

using namespace walkie::daemon;
using namespace walkie::tests::daemon_helper;
using namespace walkie::tests::helper;
using walkie::utils::EventLoop;

// ============================================================================
// Keys
// ============================================================================

TEST(ZmqMeshKeysTest, GeneratedKeysAreZ85AndDistinct)
{
    const auto a = ZmqMesh::generate_keypair();
    const auto b = ZmqMesh::generate_keypair();
    EXPECT_EQ(a.public_key.size(), 40u);
    EXPECT_EQ(a.secret_key.size(), 40u);
    EXPECT_NE(a.public_key, b.public_key);
    EXPECT_NE(a.public_key, a.secret_key);
}

TEST(ZmqMeshKeysTest, KeyFileIsCreatedPrivateAndReused)
{
    TempDir dir{"wk-key"};
    const fs::path path = dir / "sub" / "mesh.key";

    const auto created = ZmqMesh::load_or_create_keypair(path);
    ASSERT_TRUE(fs::exists(path));
    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    const auto loaded = ZmqMesh::load_or_create_keypair(path);
    EXPECT_EQ(loaded.public_key, created.public_key);
    EXPECT_EQ(loaded.secret_key, created.secret_key);
}

TEST(ZmqMeshKeysTest, MalformedKeyFilesAreRejected)
{
    TempDir dir{"wk-key"};
    const fs::path path = dir / "mesh.key";
    const auto a = ZmqMesh::generate_keypair();
    const auto b = ZmqMesh::generate_keypair();

    const std::vector<std::string> bad = {
        "not json",
        "[]",
        R"({"public":"abc","secret":"def"})",
        json{{"public", a.public_key}}.dump(),
        json{{"public", a.public_key}, {"secret", b.secret_key}}.dump(),
    };
    for (const auto &text : bad)
    {
        {
            std::ofstream out(path, std::ios::trunc);
            out << text;
        }
        EXPECT_THROW(ZmqMesh::load_or_create_keypair(path), std::runtime_error) << text;
    }
}

TEST(ZmqMeshKeysTest, ConstructorRejectsBadKeys)
{
    EventLoop loop;
    EXPECT_THROW({ ZmqMesh mesh(loop, MeshConfig{}, CurveKeypair{"short", "short"}); },
                 std::invalid_argument);
    const auto good = ZmqMesh::generate_keypair();
    EXPECT_THROW(
        { ZmqMesh mesh(loop, MeshConfig{}, CurveKeypair{good.public_key, std::string(40, ' ')}); },
        std::invalid_argument);
    EXPECT_NO_THROW({ ZmqMesh mesh(loop, MeshConfig{}, good); });
}

// ============================================================================
// Links
// ============================================================================

class ZmqMeshLinkTest : public ::testing::Test
{
  protected:
    struct Side
    {
        CurveKeypair keys = ZmqMesh::generate_keypair();
        std::unique_ptr<ZmqMesh> mesh;
        std::vector<std::unique_ptr<MeshConnection>> conns;
        std::string received;
        int closes = 0;

        [[nodiscard]] size_t live() const
        {
            size_t n = 0;
            for (const auto &c : conns)
                n += c->writable() ? 1 : 0;
            return n;
        }

        MeshConnection *first_live()
        {
            for (auto &c : conns)
                if (c->writable())
                    return c.get();
            return nullptr;
        }
    };

    void SetUp() override
    {
        if (zmq_has("curve") == 0)
            GTEST_SKIP() << "libzmq built without CURVE support";
    }

    static MeshConfig link_config(std::string listen)
    {
        MeshConfig config;
        config.listen = std::move(listen);
        config.keepalive = std::chrono::milliseconds(100);
        config.idle_timeout = std::chrono::milliseconds(3000);
        return config;
    }

    void start(Side &side, MeshConfig config)
    {
        side.mesh = std::make_unique<ZmqMesh>(m_loop, std::move(config), side.keys);
        side.mesh->start(
            [&side](std::unique_ptr<MeshConnection> conn)
            {
                conn->on_data([&side](std::string_view bytes) { side.received.append(bytes); });
                conn->on_close([&side] { ++side.closes; });
                side.conns.push_back(std::move(conn));
            });
    }

    EventLoop m_loop;
    Side m_a;
    Side m_b;

    void TearDown() override
    {
        for (Side *side : {&m_b, &m_a})
        {
            side->conns.clear();
            side->mesh.reset();
        }
    }
};

TEST_F(ZmqMeshLinkTest, DialerAndListenerExchangeData)
{
    start(m_a, link_config("tcp://127.0.0.1:*"));
    const std::string endpoint = m_a.mesh->bound_endpoint();
    ASSERT_EQ(endpoint.rfind("tcp://127.0.0.1:", 0), 0u);

    MeshConfig dial = link_config("");
    dial.peers.push_back(MeshPeerConfig{endpoint, m_a.keys.public_key});
    start(m_b, dial);
    EXPECT_TRUE(m_b.mesh->bound_endpoint().empty());

    ASSERT_TRUE(m_loop.run_until([&] { return m_a.live() == 1 && m_b.live() == 1; },
                                 kWaitTimeout));
    EXPECT_EQ(m_a.mesh->open_links(), 1u);
    EXPECT_EQ(m_b.mesh->open_links(), 1u);
    EXPECT_EQ(m_a.first_live()->remote_identity(), m_b.keys.public_key);
    EXPECT_EQ(m_b.first_live()->remote_identity(), m_a.keys.public_key);
    EXPECT_EQ(m_a.mesh->local_identity(), m_a.keys.public_key);

    ASSERT_TRUE(m_b.first_live()->write("ping\n"));
    ASSERT_TRUE(m_a.first_live()->write("pong\n"));
    ASSERT_TRUE(m_loop.run_until(
        [&] { return m_a.received == "ping\n" && m_b.received == "pong\n"; }, kWaitTimeout));
}

TEST_F(ZmqMeshLinkTest, LinkStaysUpAcrossKeepalives)
{
    start(m_a, link_config("tcp://127.0.0.1:*"));
    MeshConfig dial = link_config("");
    dial.peers.push_back(MeshPeerConfig{m_a.mesh->bound_endpoint(), m_a.keys.public_key});
    start(m_b, dial);
    ASSERT_TRUE(m_loop.run_until([&] { return m_a.live() == 1 && m_b.live() == 1; },
                                 kWaitTimeout));

    m_loop.run_for(std::chrono::milliseconds(500));
    EXPECT_EQ(m_a.live(), 1u);
    EXPECT_EQ(m_b.live(), 1u);
    EXPECT_EQ(m_a.closes + m_b.closes, 0);
}

TEST_F(ZmqMeshLinkTest, LocalCloseReachesRemoteAndDialerReconnects)
{
    start(m_a, link_config("tcp://127.0.0.1:*"));
    MeshConfig dial = link_config("");
    dial.peers.push_back(MeshPeerConfig{m_a.mesh->bound_endpoint(), m_a.keys.public_key});
    start(m_b, dial);
    ASSERT_TRUE(m_loop.run_until([&] { return m_a.live() == 1 && m_b.live() == 1; },
                                 kWaitTimeout));

    m_b.first_live()->close();
    ASSERT_TRUE(m_loop.run_until([&] { return m_a.closes == 1; }, kWaitTimeout));
    EXPECT_EQ(m_b.closes, 0);

    // The dialer opens a fresh session on its next tick.
    ASSERT_TRUE(m_loop.run_until([&] { return m_a.live() == 1 && m_b.live() == 1; },
                                 kWaitTimeout));
    EXPECT_EQ(m_a.conns.size(), 2u);
    EXPECT_EQ(m_b.conns.size(), 2u);
}

TEST_F(ZmqMeshLinkTest, MutualDialKeepsSingleLink)
{
    TempDir dir{"wk-zmq"};
    const std::string a_endpoint = "ipc://" + (dir / "a.ipc").string();
    const std::string b_endpoint = "ipc://" + (dir / "b.ipc").string();

    MeshConfig a_config = link_config(a_endpoint);
    a_config.peers.push_back(MeshPeerConfig{b_endpoint, m_b.keys.public_key});
    MeshConfig b_config = link_config(b_endpoint);
    b_config.peers.push_back(MeshPeerConfig{a_endpoint, m_a.keys.public_key});
    start(m_a, a_config);
    start(m_b, b_config);

    ASSERT_TRUE(m_loop.run_until(
        [&]
        {
            return m_a.live() == 1 && m_b.live() == 1 && m_a.mesh->open_links() == 1 &&
                   m_b.mesh->open_links() == 1;
        },
        kWaitTimeout));
    m_loop.run_for(std::chrono::milliseconds(300));
    EXPECT_EQ(m_a.live(), 1u);
    EXPECT_EQ(m_b.live(), 1u);

    ASSERT_TRUE(m_a.first_live()->write("x\n"));
    EXPECT_TRUE(m_loop.run_until([&] { return m_b.received == "x\n"; }, kWaitTimeout));
    m_a.conns.clear();
    m_b.conns.clear();
    m_a.mesh.reset();
    m_b.mesh.reset();
}

TEST_F(ZmqMeshLinkTest, JoinIsFlushedImmediately)
{
    start(m_a, link_config(""));
    auto handle = m_a.mesh->join(derive_topic("room", "s1", CryptoPolicy::minimal()));
    bool flushed = false;
    handle->flushed([&flushed] { flushed = true; });
    EXPECT_TRUE(m_loop.run_until([&flushed] { return flushed; }, kWaitTimeout));
}

TEST_F(ZmqMeshLinkTest, OversizedFrameIsDroppedByTransport)
{
    MeshConfig listen = link_config("tcp://127.0.0.1:*");
    listen.max_frame_size = 4096;
    start(m_a, listen);
    MeshConfig dial = link_config("");
    dial.peers.push_back(MeshPeerConfig{m_a.mesh->bound_endpoint(), m_a.keys.public_key});
    start(m_b, dial);
    ASSERT_TRUE(m_loop.run_until([&] { return m_a.live() == 1 && m_b.live() == 1; },
                                 kWaitTimeout));

    ASSERT_TRUE(m_b.first_live()->write(std::string(64 * 1024, 'y') + "\n"));
    m_loop.run_for(std::chrono::milliseconds(300));
    EXPECT_EQ(m_a.received.find('y'), std::string::npos);

    // The dialer reconnects and small frames flow again.
    const auto deadline = std::chrono::steady_clock::now() + kWaitTimeout;
    while (m_a.received.find("ok\n") == std::string::npos &&
           std::chrono::steady_clock::now() < deadline)
    {
        if (MeshConnection *conn = m_b.first_live(); conn != nullptr)
            static_cast<void>(conn->write("ok\n"));
        m_loop.run_for(std::chrono::milliseconds(100));
    }
    EXPECT_NE(m_a.received.find("ok\n"), std::string::npos);
    EXPECT_EQ(m_a.received.find('y'), std::string::npos);
}
