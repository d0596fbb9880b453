#include "walkie_daemon.hpp"

#include "wk_service.hpp"

namespace walkie::daemon
{

namespace
{
constexpr size_t kInstanceIdBytes = 4;

ControlServerOptions control_options(const DaemonConfig &config, const DaemonPaths &paths,
                                     const std::string &instance_id)
{
    ControlServerOptions options;
    options.socket_path = paths.socket;
    options.max_ipc_buffer = config.limits.max_ipc_buffer;
    options.max_message_size = config.limits.max_message_size;
    options.default_read_timeout = config.default_read_timeout;
    options.daemon_id = instance_id;
    return options;
}

std::unique_ptr<MeshSubstrate> require_mesh(std::unique_ptr<MeshSubstrate> mesh)
{
    if (!mesh)
    {
        throw std::invalid_argument("WalkieDaemon: a mesh substrate is required");
    }
    return mesh;
}
} // namespace

WalkieDaemon::WalkieDaemon(utils::EventLoop &loop, DaemonConfig config,
                           std::unique_ptr<MeshSubstrate> mesh)
    : m_loop(loop), m_config(std::move(config)), m_paths(m_config.paths()),
      m_instance_id(crypto::generate_random_hex(kInstanceIdBytes)),
      m_mesh(require_mesh(std::move(mesh))), m_lifecycle(m_paths),
      m_channels(m_loop, *m_mesh, m_config.crypto_policy),
      m_peers(m_loop, m_channels, m_instance_id, m_config.limits.max_peer_buffer,
              m_config.limits.max_message_size),
      m_router(m_channels, m_peers, m_instance_id, m_config.limits.max_message_size),
      m_control(m_loop, m_channels, m_router, control_options(m_config, m_paths, m_instance_id))
{
    m_on_stop = [this] { m_loop.request_stop(); };

    // Joins and leaves change the topic set every peer must hear about.
    m_channels.set_membership_listener([this](const std::string &, bool) { m_peers.reannounce(); });
    m_peers.set_message_handler([this](const std::string &identity, const MsgRecord &msg)
                                { m_router.route_inbound(identity, msg); });
    m_control.set_stop_handler(
        [this]
        {
            if (m_on_stop)
            {
                m_on_stop();
            }
        });
}

WalkieDaemon::~WalkieDaemon()
{
    shutdown();
}

utils::Result<uint64_t, DaemonError> WalkieDaemon::start()
{
    using StartResult = utils::Result<uint64_t, DaemonError>;
    if (m_running)
    {
        return StartResult::ok(platform::get_pid());
    }

    auto claimed = m_lifecycle.startup();
    if (claimed.is_error())
    {
        return claimed;
    }

    try
    {
        m_control.start();
        m_mesh->start([this](std::unique_ptr<MeshConnection> conn)
                      { m_peers.add_connection(std::move(conn)); });
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Daemon startup failed: {}", e.what());
        m_control.shutdown();
        m_mesh->shutdown();
        m_lifecycle.shutdown();
        return StartResult::error(DaemonError::StartupFailed);
    }

    m_running = true;
    LOGGER_INFO("Daemon started pid={} id={} mesh={}", claimed.content(), m_instance_id,
                format_tools::short_id(m_mesh->local_identity(), 12));
    return claimed;
}

void WalkieDaemon::run()
{
    if (!m_running)
    {
        return;
    }
    m_loop.run();
    shutdown();
}

void WalkieDaemon::shutdown()
{
    if (!m_running)
    {
        return;
    }
    m_running = false;
    LOGGER_INFO("Daemon {} shutting down", m_instance_id);

    m_control.shutdown();
    m_peers.close_all();
    m_channels.release_all();
    m_mesh->shutdown();
    m_lifecycle.shutdown();
    LOGGER_INFO("Daemon {} stopped", m_instance_id);
}

} // namespace walkie::daemon
