#include "zmq_mesh.hpp"

#include "wk_service.hpp"

#include <zmq.h>
#include <zmq_addon.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>

namespace walkie::daemon
{

namespace fs = std::filesystem;
using format_tools::short_id;

namespace
{
constexpr size_t kZ85KeyLen = 40;
constexpr size_t kZ85KeyBufSize = kZ85KeyLen + 1;
constexpr size_t kNonceBytes = 8;

constexpr char kHello = 'H';
constexpr char kData = 'D';
constexpr char kKeepalive = 'K';
constexpr char kClose = 'X';

// Headroom over max_frame_size for a record's newline and the handshake nonce.
constexpr int64_t kFrameSlack = 64;

constexpr std::string_view kZ85Alphabet =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ.-:+=^!/*?&<>()[]{}@%$#";

bool is_z85_key(std::string_view key) noexcept
{
    return key.size() == kZ85KeyLen && key.find_first_not_of(kZ85Alphabet) == std::string_view::npos;
}

std::string make_nonce()
{
    return crypto::generate_random_hex(kNonceBytes);
}
} // namespace

// ============================================================================
// Link state and connection
// ============================================================================

struct ZmqMesh::LinkState
{
    ZmqMesh *mesh = nullptr;
    std::string key;
    bool outbound = false;
    bool closed = false;
    Connection *conn = nullptr;
};

class ZmqMesh::Connection final : public MeshConnection
{
  public:
    explicit Connection(std::shared_ptr<LinkState> state) : m_state(std::move(state))
    {
        m_state->conn = this;
    }

    ~Connection() override
    {
        close();
        m_state->conn = nullptr;
    }

    const std::string &remote_identity() const noexcept override { return m_state->key; }

    bool writable() const noexcept override { return !m_state->closed && m_state->mesh != nullptr; }

    bool write(std::string_view bytes) override
    {
        if (!writable())
        {
            return false;
        }
        return m_state->mesh->write_data(*m_state, bytes);
    }

    void close() override
    {
        if (m_state->closed)
        {
            return;
        }
        m_state->closed = true;
        if (m_state->mesh != nullptr)
        {
            m_state->mesh->local_close(*m_state);
        }
    }

    void deliver(std::string_view bytes) { emit_data(bytes); }
    void remote_closed() { emit_close(); }

  private:
    std::shared_ptr<LinkState> m_state;
};

// ============================================================================
// Discovery handle
// ============================================================================

class ZmqMesh::Discovery final : public DiscoveryHandle
{
  public:
    Discovery(ZmqMesh &mesh, const TopicId &topic)
        : m_mesh(&mesh), m_mesh_alive(mesh.m_alive), m_topic(topic)
    {
    }

    ~Discovery() override { destroy(); }

    const TopicId &topic() const noexcept override { return m_topic; }

    void flushed(std::function<void()> cb) override
    {
        if (!*m_active || !*m_mesh_alive)
        {
            return;
        }
        // Bootstrap peers are dialed regardless of topic: nothing to announce.
        m_mesh->m_loop.post(
            [active = m_active, cb = std::move(cb)]
            {
                if (*active)
                {
                    cb();
                }
            });
    }

    void destroy() override
    {
        if (!*m_active)
        {
            return;
        }
        *m_active = false;
        if (*m_mesh_alive)
        {
            if (auto it = m_mesh->m_topics.find(m_topic); it != m_mesh->m_topics.end())
            {
                m_mesh->m_topics.erase(it);
            }
        }
    }

  private:
    ZmqMesh *m_mesh;
    std::shared_ptr<bool> m_mesh_alive;
    std::shared_ptr<bool> m_active = std::make_shared<bool>(true);
    TopicId m_topic;
};

// ============================================================================
// Keys
// ============================================================================

CurveKeypair ZmqMesh::generate_keypair()
{
    std::array<char, kZ85KeyBufSize> pub{};
    std::array<char, kZ85KeyBufSize> sec{};
    if (zmq_curve_keypair(pub.data(), sec.data()) != 0)
    {
        throw std::runtime_error(
            fmt::format("Mesh: zmq_curve_keypair failed: {}", zmq_strerror(zmq_errno())));
    }
    return CurveKeypair{std::string(pub.data(), kZ85KeyLen), std::string(sec.data(), kZ85KeyLen)};
}

CurveKeypair ZmqMesh::load_or_create_keypair(const fs::path &path)
{
    std::error_code ec;
    if (fs::exists(path, ec))
    {
        std::ifstream in(path);
        if (!in)
        {
            throw std::runtime_error(fmt::format("Mesh key: cannot read '{}'", path.string()));
        }
        const nlohmann::json j = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (!j.is_object() || !j.contains("public") || !j["public"].is_string() ||
            !j.contains("secret") || !j["secret"].is_string())
        {
            throw std::runtime_error(
                fmt::format("Mesh key: '{}' is not a {{public, secret}} object", path.string()));
        }
        CurveKeypair keys{j["public"].get<std::string>(), j["secret"].get<std::string>()};
        if (!is_z85_key(keys.public_key) || !is_z85_key(keys.secret_key))
        {
            throw std::runtime_error(
                fmt::format("Mesh key: '{}' does not hold Z85 Curve keys", path.string()));
        }

        std::array<char, kZ85KeyBufSize> derived{};
        if (zmq_curve_public(derived.data(), keys.secret_key.c_str()) != 0 ||
            keys.public_key != std::string_view(derived.data(), kZ85KeyLen))
        {
            throw std::runtime_error(
                fmt::format("Mesh key: public key in '{}' does not match its secret", path.string()));
        }
        return keys;
    }

    CurveKeypair keys = generate_keypair();
    fs::create_directories(path.parent_path(), ec);
    if (ec)
    {
        throw std::runtime_error(fmt::format("Mesh key: cannot create '{}': {}",
                                             path.parent_path().string(), ec.message()));
    }

    const std::string text =
        nlohmann::json{{"public", keys.public_key}, {"secret", keys.secret_key}}.dump(2) + "\n";
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        throw std::system_error(errno, std::generic_category(),
                                fmt::format("Mesh key: create '{}'", path.string()));
    }
    auto close_fd = basics::make_scope_guard([fd]() noexcept { ::close(fd); });

    size_t written = 0;
    while (written < text.size())
    {
        ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const int err = errno;
            ::unlink(path.c_str());
            throw std::system_error(err, std::generic_category(),
                                    fmt::format("Mesh key: write '{}'", path.string()));
        }
        written += static_cast<size_t>(n);
    }
    LOGGER_INFO("Mesh key created at {}", path.string());
    return keys;
}

// ============================================================================
// Construction / start / shutdown
// ============================================================================

ZmqMesh::ZmqMesh(utils::EventLoop &loop, MeshConfig config, CurveKeypair keys)
    : m_loop(loop), m_config(std::move(config)), m_keys(std::move(keys))
{
    if (!is_z85_key(m_keys.public_key) || !is_z85_key(m_keys.secret_key))
    {
        throw std::invalid_argument("ZmqMesh: keys must be 40-character Z85 strings");
    }
}

int64_t ZmqMesh::max_msg_size() const noexcept
{
    if (m_config.max_frame_size == 0)
    {
        return -1;
    }
    return static_cast<int64_t>(m_config.max_frame_size) + kFrameSlack;
}

ZmqMesh::~ZmqMesh()
{
    shutdown();
    *m_alive = false;
}

void ZmqMesh::start(ConnectionCallback on_connection)
{
    if (m_started || m_shut_down)
    {
        return;
    }
    m_on_connection = std::move(on_connection);
    zmq::context_t &ctx = utils::get_zmq_context();

    if (!m_config.listen.empty())
    {
        try
        {
            auto router = std::make_unique<zmq::socket_t>(ctx, zmq::socket_type::router);
            router->set(zmq::sockopt::linger, 0);
            router->set(zmq::sockopt::router_mandatory, 1);
            router->set(zmq::sockopt::maxmsgsize, max_msg_size());
            router->set(zmq::sockopt::curve_server, 1);
            router->set(zmq::sockopt::curve_secretkey, m_keys.secret_key);
            router->set(zmq::sockopt::curve_publickey, m_keys.public_key);
            router->bind(m_config.listen);
            m_router = std::move(router);
        }
        catch (const zmq::error_t &e)
        {
            throw std::runtime_error(
                fmt::format("Mesh: cannot listen on '{}': {}", m_config.listen, e.what()));
        }
        m_loop.add_socket(*m_router, [this](unsigned) { on_router_readable(); });
        LOGGER_INFO("Mesh: listening on {}", bound_endpoint());
    }
    LOGGER_INFO("Mesh: public key = {}", m_keys.public_key);

    for (const auto &peer : m_config.peers)
    {
        if (peer.public_key == m_keys.public_key)
        {
            LOGGER_WARN("Mesh: skipping bootstrap peer {} (our own key)", peer.endpoint);
            continue;
        }
        if (m_dialers.count(peer.public_key) != 0)
        {
            LOGGER_WARN("Mesh: duplicate bootstrap key for {}, ignored", peer.endpoint);
            continue;
        }

        Dialer dialer;
        dialer.peer = peer;
        dialer.link.key = peer.public_key;
        dialer.link.outbound = true;
        try
        {
            dialer.socket = std::make_unique<zmq::socket_t>(ctx, zmq::socket_type::dealer);
            dialer.socket->set(zmq::sockopt::linger, 0);
            dialer.socket->set(zmq::sockopt::maxmsgsize, max_msg_size());
            dialer.socket->set(zmq::sockopt::routing_id, m_keys.public_key);
            dialer.socket->set(zmq::sockopt::curve_serverkey, peer.public_key);
            dialer.socket->set(zmq::sockopt::curve_publickey, m_keys.public_key);
            dialer.socket->set(zmq::sockopt::curve_secretkey, m_keys.secret_key);
            dialer.socket->connect(peer.endpoint);
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_ERROR("Mesh: cannot dial {}: {} ({})", peer.endpoint, e.what(), e.num());
            continue;
        }

        auto [it, inserted] = m_dialers.emplace(peer.public_key, std::move(dialer));
        const std::string key = it->first;
        m_loop.add_socket(*it->second.socket, [this, key](unsigned) { on_dealer_readable(key); });
        LOGGER_INFO("Mesh: dialing {} ({})", peer.endpoint, short_id(key, 12));
    }

    m_started = true;
    tick();
}

void ZmqMesh::detach(Link &link) noexcept
{
    if (link.state)
    {
        link.state->closed = true;
        link.state->mesh = nullptr;
        link.state.reset();
    }
    link.open = false;
}

void ZmqMesh::shutdown()
{
    if (m_shut_down)
    {
        return;
    }
    m_shut_down = true;
    if (m_tick_timer != 0)
    {
        m_loop.cancel(m_tick_timer);
        m_tick_timer = 0;
    }

    for (auto &[key, dialer] : m_dialers)
    {
        if (dialer.link.open)
        {
            send_frame(dialer.link, kClose);
        }
        detach(dialer.link);
        m_loop.remove_socket(*dialer.socket);
        dialer.socket->close();
    }
    m_dialers.clear();

    for (auto &[key, link] : m_inbound)
    {
        if (link.open)
        {
            send_frame(link, kClose);
        }
        detach(link);
    }
    m_inbound.clear();

    if (m_router)
    {
        m_loop.remove_socket(*m_router);
        m_router->close();
        m_router.reset();
    }
    m_topics.clear();
    if (m_started)
    {
        LOGGER_INFO("Mesh: shut down");
    }
}

std::unique_ptr<DiscoveryHandle> ZmqMesh::join(const TopicId &topic)
{
    m_topics.insert(topic);
    return std::make_unique<Discovery>(*this, topic);
}

std::string ZmqMesh::bound_endpoint() const
{
    return m_router ? m_router->get(zmq::sockopt::last_endpoint) : std::string{};
}

size_t ZmqMesh::open_links() const
{
    size_t count = 0;
    for (const auto &[key, dialer] : m_dialers)
    {
        count += (dialer.link.open && dialer.link.state) ? 1 : 0;
    }
    for (const auto &[key, link] : m_inbound)
    {
        count += (link.open && link.state) ? 1 : 0;
    }
    return count;
}

// ============================================================================
// Sending
// ============================================================================

bool ZmqMesh::send_router(const std::string &rid, char kind, std::string_view payload)
{
    if (!m_router)
    {
        return false;
    }
    try
    {
        // Later parts of a multipart message are always accepted once the first is.
        if (!m_router->send(zmq::buffer(rid), zmq::send_flags::sndmore | zmq::send_flags::dontwait))
        {
            return false;
        }
        static_cast<void>(m_router->send(zmq::buffer(&kind, 1),
                                         zmq::send_flags::sndmore | zmq::send_flags::dontwait));
        static_cast<void>(
            m_router->send(zmq::buffer(payload.data(), payload.size()), zmq::send_flags::dontwait));
        return true;
    }
    catch (const zmq::error_t &e)
    {
        // EHOSTUNREACH: the dialer is gone (router_mandatory).
        LOGGER_DEBUG("Mesh: send to {} failed: {}", short_id(rid, 12), e.what());
        return false;
    }
}

bool ZmqMesh::send_frame(const Link &link, char kind, std::string_view payload)
{
    if (!link.outbound)
    {
        return send_router(link.key, kind, payload);
    }

    auto it = m_dialers.find(link.key);
    if (it == m_dialers.end() || !it->second.socket)
    {
        return false;
    }
    zmq::socket_t &socket = *it->second.socket;
    try
    {
        if (!socket.send(zmq::buffer(&kind, 1), zmq::send_flags::sndmore | zmq::send_flags::dontwait))
        {
            return false;
        }
        static_cast<void>(
            socket.send(zmq::buffer(payload.data(), payload.size()), zmq::send_flags::dontwait));
        return true;
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_DEBUG("Mesh: send to {} failed: {}", short_id(link.key, 12), e.what());
        return false;
    }
}

ZmqMesh::Link *ZmqMesh::find_link(const LinkState &state)
{
    Link *link = nullptr;
    if (state.outbound)
    {
        if (auto it = m_dialers.find(state.key); it != m_dialers.end())
        {
            link = &it->second.link;
        }
    }
    else if (auto it = m_inbound.find(state.key); it != m_inbound.end())
    {
        link = &it->second;
    }
    return (link != nullptr && link->state.get() == &state) ? link : nullptr;
}

bool ZmqMesh::write_data(LinkState &state, std::string_view bytes)
{
    Link *link = find_link(state);
    if (link == nullptr || !link->open)
    {
        return false;
    }
    return send_frame(*link, kData, bytes);
}

void ZmqMesh::local_close(LinkState &state)
{
    Link *link = find_link(state);
    if (link == nullptr)
    {
        return;
    }
    LOGGER_DEBUG("Mesh: closing link to {}", short_id(state.key, 12));
    if (link->outbound)
    {
        close_link(*link, /*notify_remote=*/true, /*quiet=*/true);
    }
    else
    {
        close_inbound(state.key, /*notify_remote=*/true);
    }
}

// ============================================================================
// Link state machine
// ============================================================================

bool ZmqMesh::has_open_link(const std::string &key) const
{
    if (auto it = m_dialers.find(key); it != m_dialers.end() && it->second.link.open)
    {
        return true;
    }
    auto it = m_inbound.find(key);
    return it != m_inbound.end() && it->second.open;
}

void ZmqMesh::link_opened(Link &link)
{
    // Both ends apply the same rule, so they keep the same link.
    const bool preferred = link.outbound == (m_keys.public_key < link.key);

    Link *other = nullptr;
    if (link.outbound)
    {
        if (auto it = m_inbound.find(link.key); it != m_inbound.end() && it->second.open)
        {
            other = &it->second;
        }
    }
    else if (auto it = m_dialers.find(link.key); it != m_dialers.end() && it->second.link.open)
    {
        other = &it->second.link;
    }

    if (other != nullptr)
    {
        if (!preferred)
        {
            LOGGER_DEBUG("Mesh: redundant link with {}, closing", short_id(link.key, 12));
            if (link.outbound)
            {
                close_link(link, /*notify_remote=*/true, /*quiet=*/true);
            }
            else
            {
                close_inbound(link.key, /*notify_remote=*/true);
            }
            return;
        }
        LOGGER_DEBUG("Mesh: preferring the link dialed by the lower key for {}",
                     short_id(link.key, 12));
        if (other->outbound)
        {
            close_link(*other, /*notify_remote=*/true);
        }
        else
        {
            close_inbound(link.key, /*notify_remote=*/true);
        }
    }
    emit_connection(link);
}

void ZmqMesh::emit_connection(Link &link)
{
    auto state = std::make_shared<LinkState>();
    state->mesh = this;
    state->key = link.key;
    state->outbound = link.outbound;
    link.state = state;

    auto conn = std::make_unique<Connection>(state);
    LOGGER_INFO("Mesh: link open with {} ({})", short_id(link.key, 12),
                link.outbound ? "dialed" : "accepted");
    if (m_on_connection)
    {
        m_on_connection(std::move(conn));
    }
}

void ZmqMesh::close_link(Link &link, bool notify_remote, bool quiet)
{
    if (notify_remote)
    {
        send_frame(link, kClose);
    }
    link.open = false;
    if (link.outbound)
    {
        link.nonce.clear();
        link.hello_sent = false;
    }

    std::shared_ptr<LinkState> state = std::move(link.state);
    if (state)
    {
        // A connection closed locally already knows.
        const bool was_closed = state->closed;
        state->closed = true;
        if (!quiet && !was_closed && state->conn != nullptr)
        {
            state->conn->remote_closed();
        }
    }
}

void ZmqMesh::close_inbound(const std::string &key, bool notify_remote)
{
    auto it = m_inbound.find(key);
    if (it == m_inbound.end())
    {
        return;
    }
    Link link = std::move(it->second);
    m_inbound.erase(it);
    close_link(link, notify_remote);
}

// ============================================================================
// Receiving
// ============================================================================

void ZmqMesh::on_router_readable()
{
    while (m_router)
    {
        std::vector<zmq::message_t> frames;
        zmq::recv_result_t got;
        try
        {
            got = zmq::recv_multipart(*m_router, std::back_inserter(frames),
                                      zmq::recv_flags::dontwait);
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_WARN("Mesh: listener receive failed: {}", e.what());
            return;
        }
        if (!got)
        {
            return;
        }
        if (frames.size() < 2 || frames[1].size() != 1)
        {
            LOGGER_DEBUG("Mesh: malformed listener message ({} frames)", frames.size());
            continue;
        }
        const char kind = *static_cast<const char *>(frames[1].data());
        const std::string_view payload =
            frames.size() > 2 ? frames[2].to_string_view() : std::string_view{};
        handle_router_frame(frames[0].to_string(), kind, payload);
    }
}

void ZmqMesh::handle_router_frame(const std::string &rid, char kind, std::string_view payload)
{
    if (!is_z85_key(rid) || rid == m_keys.public_key)
    {
        LOGGER_DEBUG("Mesh: dropping frame from invalid routing id");
        return;
    }
    const auto now = Clock::now();
    auto it = m_inbound.find(rid);

    switch (kind)
    {
    case kHello:
    {
        if (it != m_inbound.end() && it->second.open && it->second.nonce == payload)
        {
            it->second.last_rx = now; // repeated hello of the same session
            return;
        }
        if (it != m_inbound.end())
        {
            LOGGER_INFO("Mesh: {} reconnected", short_id(rid, 12));
            close_inbound(rid, /*notify_remote=*/false);
        }
        Link link;
        link.key = rid;
        link.open = true;
        link.nonce = std::string(payload);
        link.last_rx = now;
        auto [pos, inserted] = m_inbound.emplace(rid, std::move(link));
        send_router(rid, kHello, payload);
        link_opened(pos->second);
        return;
    }
    case kClose:
        if (it != m_inbound.end())
        {
            LOGGER_INFO("Mesh: {} closed its link", short_id(rid, 12));
            close_inbound(rid, /*notify_remote=*/false);
        }
        return;
    case kData:
    case kKeepalive:
        if (it == m_inbound.end() || !it->second.open)
        {
            // Session unknown here (e.g. we restarted): make the dialer start over.
            send_router(rid, kClose);
            return;
        }
        it->second.last_rx = now;
        if (kind == kData && it->second.state && it->second.state->conn != nullptr)
        {
            it->second.state->conn->deliver(payload);
        }
        return;
    default:
        LOGGER_DEBUG("Mesh: unknown frame kind {:#x} from {}", static_cast<unsigned char>(kind),
                     short_id(rid, 12));
        return;
    }
}

void ZmqMesh::on_dealer_readable(const std::string &key)
{
    for (;;)
    {
        auto it = m_dialers.find(key);
        if (it == m_dialers.end() || !it->second.socket)
        {
            return;
        }
        std::vector<zmq::message_t> frames;
        zmq::recv_result_t got;
        try
        {
            got = zmq::recv_multipart(*it->second.socket, std::back_inserter(frames),
                                      zmq::recv_flags::dontwait);
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_WARN("Mesh: receive from {} failed: {}", short_id(key, 12), e.what());
            return;
        }
        if (!got)
        {
            return;
        }
        if (frames.empty() || frames[0].size() != 1)
        {
            LOGGER_DEBUG("Mesh: malformed message from {}", short_id(key, 12));
            continue;
        }
        const char kind = *static_cast<const char *>(frames[0].data());
        const std::string_view payload =
            frames.size() > 1 ? frames[1].to_string_view() : std::string_view{};
        handle_dealer_frame(it->second, kind, payload);
    }
}

void ZmqMesh::handle_dealer_frame(Dialer &dialer, char kind, std::string_view payload)
{
    Link &link = dialer.link;
    switch (kind)
    {
    case kHello:
        if (!link.open && link.hello_sent && payload == link.nonce)
        {
            link.open = true;
            link.last_rx = Clock::now();
            link_opened(link);
        }
        return;
    case kClose:
        if (link.open)
        {
            LOGGER_INFO("Mesh: {} closed our link", short_id(link.key, 12));
            close_link(link, /*notify_remote=*/false);
        }
        return;
    case kData:
    case kKeepalive:
        if (!link.open)
        {
            return;
        }
        link.last_rx = Clock::now();
        if (kind == kData && link.state && link.state->conn != nullptr)
        {
            link.state->conn->deliver(payload);
        }
        return;
    default:
        LOGGER_DEBUG("Mesh: unknown frame kind {:#x} from {}", static_cast<unsigned char>(kind),
                     short_id(link.key, 12));
        return;
    }
}

// ============================================================================
// Keepalive / idle detection / redial
// ============================================================================

void ZmqMesh::schedule_tick()
{
    m_tick_timer = m_loop.schedule(m_config.keepalive,
                                   [this, alive = m_alive]
                                   {
                                       if (*alive)
                                       {
                                           m_tick_timer = 0;
                                           tick();
                                       }
                                   });
}

void ZmqMesh::tick()
{
    if (m_shut_down)
    {
        return;
    }
    const auto now = Clock::now();

    for (auto &[key, dialer] : m_dialers)
    {
        Link &link = dialer.link;
        if (link.open)
        {
            if (now - link.last_rx > m_config.idle_timeout)
            {
                LOGGER_WARN("Mesh: link to {} idle, closing", dialer.peer.endpoint);
                close_link(link, /*notify_remote=*/true);
            }
            else
            {
                send_frame(link, kKeepalive);
            }
            continue;
        }
        if (has_open_link(key))
        {
            continue;
        }
        // One hello per session; a new nonce once the previous one went unanswered.
        if (link.hello_sent && now - link.hello_at < m_config.idle_timeout)
        {
            continue;
        }
        link.nonce = make_nonce();
        link.hello_sent = send_frame(link, kHello, link.nonce);
        link.hello_at = now;
    }

    std::vector<std::string> idle;
    for (auto &[key, link] : m_inbound)
    {
        if (now - link.last_rx > m_config.idle_timeout)
        {
            idle.push_back(key);
        }
        else if (link.open)
        {
            send_frame(link, kKeepalive);
        }
    }
    for (const auto &key : idle)
    {
        LOGGER_WARN("Mesh: link from {} idle, closing", short_id(key, 12));
        close_inbound(key, /*notify_remote=*/true);
    }

    schedule_tick();
}

} // namespace walkie::daemon
