#pragma once
/**
 * @file zmq_mesh.hpp
 * @brief Mesh substrate over ZeroMQ ROUTER/DEALER sockets secured with CurveZMQ.
 *
 * Every daemon binds one ROUTER (the listener, a Curve server) and opens one DEALER
 * per configured bootstrap peer. A DEALER's routing id is its own Curve public key,
 * so the listener learns the dialer's identity from the first frame.
 *
 * ## Link framing
 *
 * DEALER side: `[kind][payload]`; ROUTER side: `[routing id][kind][payload]`.
 *
 * | kind | payload         | meaning                                           |
 * |------|-----------------|---------------------------------------------------|
 * | `H`  | handshake nonce | dialer opens a link; the listener echoes it back  |
 * | `D`  | stream bytes    | data for the `MeshConnection`                     |
 * | `K`  | empty           | keepalive                                         |
 * | `X`  | empty           | link closed                                       |
 *
 * A link is idle once nothing has arrived for `idle_timeout`; both ends then close
 * it and the dialer starts a new handshake. When two daemons dial each other, the
 * link dialed by the lower public key is kept and the other is closed, so each pair
 * ends up with a single `MeshConnection`.
 *
 * Discovery is static: every configured peer is dialed whatever topics are joined,
 * and the peer handshake decides which channels match. `join()` is therefore
 * flushed immediately.
 */
#include "daemon_config.hpp"
#include "mesh.hpp"

#include "utils/event_loop.hpp"

#include <zmq.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>

namespace walkie::daemon
{

/// Curve keypair, both halves Z85-encoded (40 characters).
struct CurveKeypair
{
    std::string public_key;
    std::string secret_key;
};

class ZmqMesh : public MeshSubstrate
{
  public:
    /**
     * @param config  Listen endpoint, bootstrap peers and link timing.
     * @param keys    This daemon's identity.
     * @throws std::invalid_argument if a key is not 40 Z85 characters.
     */
    ZmqMesh(utils::EventLoop &loop, MeshConfig config, CurveKeypair keys);
    ~ZmqMesh() override;

    ZmqMesh(const ZmqMesh &) = delete;
    ZmqMesh &operator=(const ZmqMesh &) = delete;

    static CurveKeypair generate_keypair();

    /**
     * @brief Reads the keypair stored at @p path, creating it (mode 0600) if missing.
     * @throws std::runtime_error if the file is unreadable or malformed.
     */
    static CurveKeypair load_or_create_keypair(const std::filesystem::path &path);

    void start(ConnectionCallback on_connection) override;
    [[nodiscard]] std::unique_ptr<DiscoveryHandle> join(const TopicId &topic) override;
    void shutdown() override;
    [[nodiscard]] std::string local_identity() const override { return m_keys.public_key; }

    /// Endpoint actually bound (resolves a wildcard port); empty if not listening.
    [[nodiscard]] std::string bound_endpoint() const;

    /// Links that completed the handshake and carry a connection.
    [[nodiscard]] size_t open_links() const;

  private:
    using Clock = std::chrono::steady_clock;

    struct LinkState;
    class Connection;
    class Discovery;

    struct Link
    {
        std::string key; ///< Remote public key.
        bool outbound = false;
        bool open = false;
        std::string nonce;
        bool hello_sent = false;
        Clock::time_point hello_at{};
        Clock::time_point last_rx{};
        std::shared_ptr<LinkState> state; ///< Shared with the emitted connection.
    };

    struct Dialer
    {
        MeshPeerConfig peer;
        std::unique_ptr<zmq::socket_t> socket;
        Link link;
    };

    void on_router_readable();
    void on_dealer_readable(const std::string &key);
    void handle_router_frame(const std::string &rid, char kind, std::string_view payload);
    void handle_dealer_frame(Dialer &dialer, char kind, std::string_view payload);

    void link_opened(Link &link);
    void emit_connection(Link &link);
    /// Detaches the connection (firing its close unless @p quiet) and optionally
    /// tells the remote.
    void close_link(Link &link, bool notify_remote, bool quiet = false);
    void close_inbound(const std::string &key, bool notify_remote);

    [[nodiscard]] int64_t max_msg_size() const noexcept;
    bool send_frame(const Link &link, char kind, std::string_view payload = {});
    bool send_router(const std::string &rid, char kind, std::string_view payload = {});
    bool write_data(LinkState &state, std::string_view bytes);
    void local_close(LinkState &state);
    void detach(Link &link) noexcept;

    void schedule_tick();
    void tick();
    [[nodiscard]] bool has_open_link(const std::string &key) const;
    [[nodiscard]] Link *find_link(const LinkState &state);

    utils::EventLoop &m_loop;
    MeshConfig m_config;
    CurveKeypair m_keys;
    ConnectionCallback m_on_connection;

    std::unique_ptr<zmq::socket_t> m_router;
    std::map<std::string, Dialer> m_dialers;
    std::map<std::string, Link> m_inbound;
    std::multiset<TopicId> m_topics;

    utils::EventLoop::TimerId m_tick_timer = 0;
    bool m_started = false;
    bool m_shut_down = false;
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};

} // namespace walkie::daemon
