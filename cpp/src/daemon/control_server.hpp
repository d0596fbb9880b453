#pragma once
/**
 * @file control_server.hpp
 * @brief Local control socket: newline-delimited JSON requests from local clients.
 *
 * The server binds a Unix stream socket (mode 0600) and serves any number of clients
 * on the daemon's event loop. Each request line is answered with exactly one JSON
 * line, except a `join` or waiting `read` whose client disconnects first.
 *
 * ## Actions
 *
 * | action   | parameters                     | reply                                   |
 * |----------|--------------------------------|-----------------------------------------|
 * | `join`   | `channel`, `secret`            | `{ok, channel}` once discoverable       |
 * | `send`   | `channel`, `message`           | `{ok, delivered}`                       |
 * | `read`   | `channel`, `wait?`, `timeout?` | `{ok, messages}`                        |
 * | `leave`  | `channel`                      | `{ok}`                                  |
 * | `status` |                                | `{ok, channels, daemonId}`              |
 * | `ping`   |                                | `{ok}`                                  |
 * | `stop`   |                                | `{ok}`, then the stop handler runs      |
 *
 * Failures reply `{ok:false, error}`. Only an oversized request closes the
 * connection.
 */
#include "channel_registry.hpp"
#include "daemon_error.hpp"
#include "message_router.hpp"

#include "utils/event_loop.hpp"
#include "utils/line_framer.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>

namespace walkie::daemon
{

struct ControlServerOptions
{
    std::filesystem::path socket_path;
    size_t max_ipc_buffer = 1024 * 1024;
    size_t max_message_size = 256 * 1024;
    std::chrono::milliseconds default_read_timeout{30000};
    std::string daemon_id;
};

class ControlServer
{
  public:
    using StopHandler = std::function<void()>;

    ControlServer(utils::EventLoop &loop, ChannelRegistry &channels, MessageRouter &router,
                  ControlServerOptions options);
    ~ControlServer();

    ControlServer(const ControlServer &) = delete;
    ControlServer &operator=(const ControlServer &) = delete;

    /// Runs after the reply to a `stop` request has been queued.
    void set_stop_handler(StopHandler handler) { m_on_stop = std::move(handler); }

    /**
     * @brief Binds and listens. The socket path must not exist.
     * @throws std::system_error on socket, bind or listen failure.
     * @throws std::runtime_error if the path does not fit a Unix socket address.
     */
    void start();

    /// Cancels suspended reads, flushes pending replies best-effort and closes every
    /// socket. The socket path is left for the lifecycle manager. Idempotent.
    void shutdown();

    [[nodiscard]] bool listening() const noexcept { return m_listen_fd >= 0; }
    [[nodiscard]] size_t client_count() const noexcept { return m_clients.size(); }
    [[nodiscard]] const std::filesystem::path &socket_path() const noexcept
    {
        return m_options.socket_path;
    }

  private:
    using ClientId = uint64_t;

    struct Client
    {
        explicit Client(int fd_, size_t max_buffer) : fd(fd_), framer(max_buffer) {}

        int fd;
        utils::LineFramer framer;
        std::string outbuf;
        std::set<WaiterId> waiters;
        bool close_after_flush = false;
    };

    void on_accept();
    void on_client_event(ClientId id, unsigned revents);
    void read_client(ClientId id);
    void handle_line(ClientId id, const std::string &line);
    void dispatch(ClientId id, const nlohmann::json &request);

    void do_join(ClientId id, const nlohmann::json &request);
    void do_send(ClientId id, const nlohmann::json &request);
    void do_read(ClientId id, const nlohmann::json &request);
    void do_leave(ClientId id, const nlohmann::json &request);
    void do_status(ClientId id);

    void reply(ClientId id, const nlohmann::json &body);
    void reply_error(ClientId id, const std::string &message);
    void reply_error(ClientId id, DaemonError err, const std::string &detail = {});
    void flush(ClientId id);
    void disconnect(ClientId id);

    [[nodiscard]] std::chrono::milliseconds read_timeout(const nlohmann::json &request) const;
    Client *find(ClientId id);

    utils::EventLoop &m_loop;
    ChannelRegistry &m_channels;
    MessageRouter &m_router;
    ControlServerOptions m_options;
    StopHandler m_on_stop;

    int m_listen_fd = -1;
    std::map<ClientId, Client> m_clients;
    ClientId m_next_client_id = 1;
};

} // namespace walkie::daemon
