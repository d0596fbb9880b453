#pragma once
/**
 * @file walkie_daemon.hpp
 * @brief One daemon instance: every component wired together on one event loop.
 *
 * ```cpp
 * utils::EventLoop loop;
 * WalkieDaemon daemon(loop, DaemonConfig::load(dir, std::nullopt), std::move(mesh));
 * if (auto started = daemon.start(); started.is_error())
 *     return 1;
 * daemon.run(); // until a `stop` request or request_stop()
 * ```
 *
 * Several instances may share one loop (tests, `--self-test`); each then needs its own
 * directory and a stop handler that does not stop the shared loop.
 */
#include "channel_registry.hpp"
#include "control_server.hpp"
#include "daemon_config.hpp"
#include "daemon_error.hpp"
#include "daemon_lifecycle.hpp"
#include "mesh.hpp"
#include "message_router.hpp"
#include "peer_registry.hpp"

#include "utils/event_loop.hpp"
#include "utils/result.hpp"

#include <functional>
#include <memory>
#include <string>

namespace walkie::daemon
{

class WalkieDaemon
{
  public:
    WalkieDaemon(utils::EventLoop &loop, DaemonConfig config, std::unique_ptr<MeshSubstrate> mesh);
    ~WalkieDaemon();

    WalkieDaemon(const WalkieDaemon &) = delete;
    WalkieDaemon &operator=(const WalkieDaemon &) = delete;

    /**
     * @brief Claims the directory, binds the control socket and starts the mesh.
     * @return Our PID, or `AlreadyRunning` / `StartupFailed`. Nothing is left behind
     *         on failure.
     */
    [[nodiscard]] utils::Result<uint64_t, DaemonError> start();

    /// Runs the loop until a stop is requested, then shuts down.
    void run();

    /// Replaces what a `stop` request does; the default stops the event loop.
    void set_stop_handler(std::function<void()> handler) { m_on_stop = std::move(handler); }

    /// Flushes replies, closes peers, releases topics, stops the mesh and removes the
    /// on-disk state. Idempotent.
    void shutdown();

    [[nodiscard]] bool running() const noexcept { return m_running; }
    [[nodiscard]] const std::string &instance_id() const noexcept { return m_instance_id; }
    [[nodiscard]] const DaemonConfig &config() const noexcept { return m_config; }
    [[nodiscard]] const DaemonPaths &paths() const noexcept { return m_paths; }

    [[nodiscard]] ChannelRegistry &channels() noexcept { return m_channels; }
    [[nodiscard]] PeerRegistry &peers() noexcept { return m_peers; }
    [[nodiscard]] MessageRouter &router() noexcept { return m_router; }
    [[nodiscard]] ControlServer &control() noexcept { return m_control; }
    [[nodiscard]] MeshSubstrate &mesh() noexcept { return *m_mesh; }

  private:
    utils::EventLoop &m_loop;
    DaemonConfig m_config;
    DaemonPaths m_paths;
    std::string m_instance_id;
    std::function<void()> m_on_stop;
    bool m_running = false;

    // Declaration order is teardown order reversed.
    std::unique_ptr<MeshSubstrate> m_mesh;
    DaemonLifecycle m_lifecycle;
    ChannelRegistry m_channels;
    PeerRegistry m_peers;
    MessageRouter m_router;
    ControlServer m_control;
};

} // namespace walkie::daemon
