#include "self_test.hpp"

#include "loopback_mesh.hpp"
#include "walkie_daemon.hpp"

#include "wk_service.hpp"

namespace walkie::daemon
{

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace
{
constexpr auto kStepTimeout = 5000ms;
constexpr auto kNoMatchSettle = 300ms;

DaemonConfig self_test_config(const fs::path &dir)
{
    DaemonConfig config = DaemonConfig::with_defaults();
    config.dir = dir;
    config.crypto_policy = CryptoPolicy::minimal();
    config.mesh.listen.clear();
    return config;
}

size_t matched(WalkieDaemon &daemon, const std::string &channel)
{
    const Channel *ch = daemon.channels().find(channel);
    return ch == nullptr ? 0 : ch->matched_peers.size();
}

size_t buffered(WalkieDaemon &daemon, const std::string &channel)
{
    const Channel *ch = daemon.channels().find(channel);
    return ch == nullptr ? 0 : ch->pending.size();
}

class Scenario
{
  public:
    explicit Scenario(const fs::path &root)
        : m_network(m_loop),
          m_a(m_loop, self_test_config(root / "a"), std::make_unique<LoopbackMesh>(m_network)),
          m_b(m_loop, self_test_config(root / "b"), std::make_unique<LoopbackMesh>(m_network))
    {
        // Both daemons share the loop; a stop request must not end it.
        m_a.set_stop_handler([] {});
        m_b.set_stop_handler([] {});
    }

    bool run()
    {
        return step("start both daemons", [this] { return start(); }) &&
               step("join 'room' with the same secret", [this] { return join_matching(); }) &&
               step("send 'hi' from A and read it on B", [this] { return send_and_read(); }) &&
               step("different secrets never match", [this] { return wrong_secret(); });
    }

    void stop()
    {
        m_a.shutdown();
        m_b.shutdown();
    }

  private:
    template <typename F> bool step(const char *name, F &&body)
    {
        const bool ok = body();
        if (ok)
            LOGGER_INFO("self-test: {} ... ok", name);
        else
            LOGGER_ERROR("self-test: {} ... FAILED", name);
        return ok;
    }

    bool start()
    {
        return m_a.start().is_ok() && m_b.start().is_ok();
    }

    bool join(WalkieDaemon &daemon, const std::string &channel, const std::string &secret)
    {
        bool done = false;
        daemon.channels().join(channel, secret, [&done] { done = true; });
        return m_loop.run_until([&done] { return done; }, kStepTimeout);
    }

    bool join_matching()
    {
        if (!join(m_a, "room", "s1") || !join(m_b, "room", "s1"))
        {
            return false;
        }
        return m_loop.run_until([this]
                                { return matched(m_a, "room") == 1 && matched(m_b, "room") == 1; },
                                kStepTimeout);
    }

    bool send_and_read()
    {
        auto sent = m_a.router().send("room", "hi");
        if (sent.is_error() || sent.content() != 1)
        {
            return false;
        }
        if (!m_loop.run_until([this] { return buffered(m_b, "room") == 1; }, kStepTimeout))
        {
            return false;
        }
        auto read = m_b.channels().drain("room");
        if (read.is_error() || read.content().size() != 1)
        {
            return false;
        }
        const MessageEntry &entry = read.content().front();
        return entry.data == "hi" && entry.from == m_a.instance_id();
    }

    bool wrong_secret()
    {
        if (!join(m_a, "lobby", "s1") || !join(m_b, "lobby", "s2"))
        {
            return false;
        }
        m_loop.run_for(kNoMatchSettle);
        if (matched(m_a, "lobby") != 0 || matched(m_b, "lobby") != 0)
        {
            return false;
        }
        auto sent = m_a.router().send("lobby", "secret");
        return sent.is_ok() && sent.content() == 0;
    }

    utils::EventLoop m_loop;
    LoopbackNetwork m_network;
    WalkieDaemon m_a;
    WalkieDaemon m_b;
};
} // namespace

bool run_self_test(const fs::path &work_root)
{
    const fs::path root =
        work_root / fmt::format("walkie-self-test-{}", crypto::generate_random_hex(4));
    LOGGER_INFO("self-test: running in {}", root.string());

    bool passed = false;
    try
    {
        Scenario scenario(root);
        passed = scenario.run();
        scenario.stop();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("self-test: aborted: {}", e.what());
        passed = false;
    }

    std::error_code ec;
    fs::remove_all(root, ec);
    if (ec)
    {
        LOGGER_WARN("self-test: could not remove {}: {}", root.string(), ec.message());
    }
    LOGGER_INFO("self-test: {}", passed ? "PASSED" : "FAILED");
    return passed;
}

} // namespace walkie::daemon
