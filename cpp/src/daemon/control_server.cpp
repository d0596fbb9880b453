#include "control_server.hpp"

#include "wk_service.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <system_error>

namespace walkie::daemon
{

using nlohmann::json;

namespace
{
constexpr int kListenBacklog = 64;
constexpr size_t kReadChunk = 64 * 1024;
// The socket stays readable, so a busy client is picked up again next iteration.
constexpr int kReadsPerWakeup = 16;
// Longest suspended read; longer requests are clamped.
constexpr double kMaxReadTimeoutMs = 2147483647.0;

std::string dump_line(const json &body)
{
    std::string line = body.dump(-1, ' ', false, json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

// Null unless request[key] is a string.
const std::string *string_param(const json &request, const char *key)
{
    auto it = request.find(key);
    if (it == request.end() || !it->is_string())
    {
        return nullptr;
    }
    return it->get_ptr<const std::string *>();
}
} // namespace

ControlServer::ControlServer(utils::EventLoop &loop, ChannelRegistry &channels,
                             MessageRouter &router, ControlServerOptions options)
    : m_loop(loop), m_channels(channels), m_router(router), m_options(std::move(options))
{
}

ControlServer::~ControlServer()
{
    shutdown();
}

// ============================================================================
// Listening socket
// ============================================================================

void ControlServer::start()
{
    const std::string path = m_options.socket_path.string();
    sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
    {
        throw std::runtime_error(
            fmt::format("Control socket path does not fit a Unix socket address: '{}'", path));
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        throw std::system_error(errno, std::generic_category(), "control socket");
    }
    auto close_fd = basics::make_scope_guard([fd]() noexcept { ::close(fd); });

    if (::bind(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) != 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("bind '{}'", path));
    }
    if (::chmod(path.c_str(), 0600) != 0)
    {
        const int err = errno;
        ::unlink(path.c_str());
        throw std::system_error(err, std::generic_category(), fmt::format("chmod '{}'", path));
    }
    if (::listen(fd, kListenBacklog) != 0)
    {
        const int err = errno;
        ::unlink(path.c_str());
        throw std::system_error(err, std::generic_category(), fmt::format("listen '{}'", path));
    }

    close_fd.dismiss();
    m_listen_fd = fd;
    m_loop.add_fd(m_listen_fd, utils::EventLoop::kReadable, [this](unsigned) { on_accept(); });
    LOGGER_INFO("Control socket listening on {}", path);
}

void ControlServer::on_accept()
{
    while (m_listen_fd >= 0)
    {
        int fd = ::accept4(m_listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK)
            {
                LOGGER_WARN("Control socket accept failed: {}", std::strerror(errno));
            }
            return;
        }

        const ClientId id = m_next_client_id++;
        m_clients.try_emplace(id, fd, m_options.max_ipc_buffer);
        m_loop.add_fd(fd, utils::EventLoop::kReadable,
                      [this, id](unsigned revents) { on_client_event(id, revents); });
        LOGGER_DEBUG("Control client #{} connected", id);
    }
}

void ControlServer::shutdown()
{
    if (m_listen_fd >= 0)
    {
        m_loop.remove_fd(m_listen_fd);
        ::close(m_listen_fd);
        m_listen_fd = -1;
    }

    for (auto &[id, client] : m_clients)
    {
        for (WaiterId waiter : client.waiters)
        {
            m_channels.cancel_waiter(waiter);
        }
        client.waiters.clear();

        // Best effort: one non-blocking attempt per client.
        if (!client.outbuf.empty())
        {
            ssize_t n = ::send(client.fd, client.outbuf.data(), client.outbuf.size(),
                               MSG_NOSIGNAL | MSG_DONTWAIT);
            if (n < 0 || static_cast<size_t>(n) < client.outbuf.size())
            {
                LOGGER_DEBUG("Control client #{}: reply truncated at shutdown", id);
            }
        }
        m_loop.remove_fd(client.fd);
        ::close(client.fd);
    }
    m_clients.clear();
}

// ============================================================================
// Client I/O
// ============================================================================

ControlServer::Client *ControlServer::find(ClientId id)
{
    auto it = m_clients.find(id);
    return it == m_clients.end() ? nullptr : &it->second;
}

void ControlServer::on_client_event(ClientId id, unsigned revents)
{
    if ((revents & utils::EventLoop::kWritable) != 0)
    {
        flush(id);
    }
    if ((revents & (utils::EventLoop::kReadable | utils::EventLoop::kError)) != 0)
    {
        read_client(id);
    }
}

void ControlServer::read_client(ClientId id)
{
    char buf[kReadChunk];
    std::vector<std::string> lines;
    for (int round = 0; round < kReadsPerWakeup; ++round)
    {
        Client *client = find(id);
        if (client == nullptr || client->close_after_flush)
        {
            return;
        }

        ssize_t n = ::recv(client->fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            return;
        }
        if (n <= 0)
        {
            disconnect(id);
            return;
        }

        lines.clear();
        const auto status =
            client->framer.feed(std::string_view(buf, static_cast<size_t>(n)), lines);
        for (const auto &line : lines)
        {
            handle_line(id, line);
            if (find(id) == nullptr)
            {
                return;
            }
        }

        if (status == utils::LineFramer::Status::Overflow)
        {
            LOGGER_WARN("Control client #{} exceeded the request size limit", id);
            reply_error(id, DaemonError::RequestTooLarge);
            if (Client *c = find(id); c != nullptr)
            {
                c->close_after_flush = true;
                flush(id);
            }
            return;
        }
    }
}

void ControlServer::flush(ClientId id)
{
    Client *client = find(id);
    if (client == nullptr)
    {
        return;
    }

    while (!client->outbuf.empty())
    {
        ssize_t n = ::send(client->fd, client->outbuf.data(), client->outbuf.size(),
                           MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0)
        {
            client->outbuf.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
        {
            m_loop.update_fd(client->fd, client->close_after_flush
                                             ? utils::EventLoop::kWritable
                                             : utils::EventLoop::kReadable |
                                                   utils::EventLoop::kWritable);
            return;
        }
        LOGGER_DEBUG("Control client #{} write failed: {}", id, std::strerror(errno));
        disconnect(id);
        return;
    }

    if (client->close_after_flush)
    {
        disconnect(id);
        return;
    }
    m_loop.update_fd(client->fd, utils::EventLoop::kReadable);
}

void ControlServer::disconnect(ClientId id)
{
    auto it = m_clients.find(id);
    if (it == m_clients.end())
    {
        return;
    }
    Client &client = it->second;
    for (WaiterId waiter : client.waiters)
    {
        m_channels.cancel_waiter(waiter);
    }
    m_loop.remove_fd(client.fd);
    ::close(client.fd);
    m_clients.erase(it);
    LOGGER_DEBUG("Control client #{} disconnected", id);
}

void ControlServer::reply(ClientId id, const json &body)
{
    Client *client = find(id);
    if (client == nullptr)
    {
        return;
    }
    client->outbuf += dump_line(body);
    flush(id);
}

void ControlServer::reply_error(ClientId id, const std::string &message)
{
    reply(id, json{{"ok", false}, {"error", message}});
}

void ControlServer::reply_error(ClientId id, DaemonError err, const std::string &detail)
{
    switch (err)
    {
    case DaemonError::NotInChannel:
        reply_error(id, fmt::format("Not in channel: {}", detail));
        return;
    case DaemonError::MessageTooLarge:
        reply_error(id,
                    fmt::format("Message too large (max {}KB)", m_options.max_message_size / 1024));
        return;
    case DaemonError::UnknownAction:
        reply_error(id, fmt::format("Unknown action: {}", detail));
        return;
    case DaemonError::InvalidRequest:
        reply_error(id, fmt::format("Missing or invalid '{}'", detail));
        return;
    case DaemonError::RequestTooLarge:
        reply_error(id, "Request too large");
        return;
    case DaemonError::AlreadyRunning:
    case DaemonError::StartupFailed:
        break;
    }
    reply_error(id, std::string(to_string(err)));
}

// ============================================================================
// Dispatch
// ============================================================================

void ControlServer::handle_line(ClientId id, const std::string &line)
{
    json request;
    try
    {
        request = json::parse(line);
    }
    catch (const json::parse_error &e)
    {
        reply_error(id, e.what());
        return;
    }

    try
    {
        dispatch(id, request);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Control request failed: {}", e.what());
        reply_error(id, e.what());
    }
}

void ControlServer::dispatch(ClientId id, const json &request)
{
    const std::string *action = request.is_object() ? string_param(request, "action") : nullptr;
    if (action == nullptr)
    {
        reply_error(id, DaemonError::InvalidRequest, "action");
        return;
    }
    LOGGER_TRACE("Control client #{}: {}", id, *action);

    if (*action == "join")
    {
        do_join(id, request);
    }
    else if (*action == "send")
    {
        do_send(id, request);
    }
    else if (*action == "read")
    {
        do_read(id, request);
    }
    else if (*action == "leave")
    {
        do_leave(id, request);
    }
    else if (*action == "status")
    {
        do_status(id);
    }
    else if (*action == "ping")
    {
        reply(id, json{{"ok", true}});
    }
    else if (*action == "stop")
    {
        LOGGER_INFO("Stop requested by control client #{}", id);
        reply(id, json{{"ok", true}});
        if (m_on_stop)
        {
            m_on_stop();
        }
    }
    else
    {
        reply_error(id, DaemonError::UnknownAction, *action);
    }
}

void ControlServer::do_join(ClientId id, const json &request)
{
    const std::string *channel = string_param(request, "channel");
    if (channel == nullptr)
    {
        reply_error(id, DaemonError::InvalidRequest, "channel");
        return;
    }
    const std::string *secret = string_param(request, "secret");
    if (secret == nullptr)
    {
        reply_error(id, DaemonError::InvalidRequest, "secret");
        return;
    }

    m_channels.join(*channel, *secret,
                    [this, id, name = *channel]
                    { reply(id, json{{"ok", true}, {"channel", name}}); });
}

void ControlServer::do_send(ClientId id, const json &request)
{
    const std::string *channel = string_param(request, "channel");
    if (channel == nullptr)
    {
        reply_error(id, DaemonError::InvalidRequest, "channel");
        return;
    }
    const std::string *message = string_param(request, "message");
    if (message == nullptr)
    {
        reply_error(id, DaemonError::InvalidRequest, "message");
        return;
    }

    auto sent = m_router.send(*channel, *message);
    if (sent.is_error())
    {
        reply_error(id, sent.error(), *channel);
        return;
    }
    reply(id, json{{"ok", true}, {"delivered", sent.content()}});
}

std::chrono::milliseconds ControlServer::read_timeout(const json &request) const
{
    auto it = request.find("timeout");
    if (it == request.end() || !it->is_number())
    {
        return m_options.default_read_timeout;
    }
    const double seconds = it->get<double>();
    if (!(seconds > 0.0))
    {
        return m_options.default_read_timeout;
    }
    const double ms = std::min(std::ceil(seconds * 1000.0), kMaxReadTimeoutMs);
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

void ControlServer::do_read(ClientId id, const json &request)
{
    const std::string *channel = string_param(request, "channel");
    if (channel == nullptr)
    {
        reply_error(id, DaemonError::InvalidRequest, "channel");
        return;
    }
    auto it = request.find("wait");
    const bool wait = it != request.end() && it->is_boolean() && it->get<bool>();

    auto drained = m_channels.drain(*channel);
    if (drained.is_error())
    {
        reply_error(id, drained.error(), *channel);
        return;
    }
    Messages messages = std::move(drained).content();
    if (!messages.empty() || !wait)
    {
        reply(id, json{{"ok", true}, {"messages", messages}});
        return;
    }

    const auto timeout = read_timeout(request);
    auto waiter_id = std::make_shared<WaiterId>(0);
    auto added = m_channels.add_waiter(
        *channel, timeout,
        [this, id, waiter_id](Messages result)
        {
            if (Client *client = find(id); client != nullptr)
            {
                client->waiters.erase(*waiter_id);
            }
            reply(id, json{{"ok", true}, {"messages", result}});
        });
    if (added.is_error())
    {
        reply_error(id, added.error(), *channel);
        return;
    }
    *waiter_id = added.content();
    if (Client *client = find(id); client != nullptr)
    {
        client->waiters.insert(*waiter_id);
    }
    LOGGER_DEBUG("Control client #{} waiting on '{}' for {} ms", id, *channel, timeout.count());
}

void ControlServer::do_leave(ClientId id, const json &request)
{
    const std::string *channel = string_param(request, "channel");
    if (channel == nullptr)
    {
        reply_error(id, DaemonError::InvalidRequest, "channel");
        return;
    }
    const std::string name = *channel;
    m_channels.leave(name);
    reply(id, json{{"ok", true}});
}

void ControlServer::do_status(ClientId id)
{
    json channels = json::object();
    for (const auto &[name, status] : m_channels.status())
    {
        channels[name] = json{{"peers", status.peers}, {"buffered", status.buffered}};
    }
    reply(id, json{{"ok", true}, {"channels", channels}, {"daemonId", m_options.daemon_id}});
}

} // namespace walkie::daemon
