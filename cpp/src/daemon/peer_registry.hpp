#pragma once
/**
 * @file peer_registry.hpp
 * @brief Live peer connections and the hello / topic-matching handshake.
 *
 * Single-threaded access only (daemon event loop). Each peer is keyed by the remote
 * identity the mesh reports; a second connection with the same identity replaces the
 * first. On connect the registry immediately sends a hello listing every joined
 * topic; a remote hello matches the topics both sides hold and unmatches those the
 * remote no longer announces.
 *
 * Peers torn down from inside one of their own callbacks are parked and destroyed on
 * the next loop iteration, so a connection never outlives its own callback frame.
 */
#include "channel_registry.hpp"
#include "mesh.hpp"
#include "peer_protocol.hpp"

#include "utils/event_loop.hpp"
#include "utils/line_framer.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace walkie::daemon
{

struct PeerEntry
{
    PeerEntry(std::string id, uint64_t gen, std::unique_ptr<MeshConnection> c, size_t max_buffer)
        : identity(std::move(id)), generation(gen), conn(std::move(c)), framer(max_buffer)
    {
    }

    std::string identity;
    uint64_t generation;
    std::unique_ptr<MeshConnection> conn;
    std::optional<std::set<std::string>> known_topics; ///< Absent until the first hello.
    std::set<std::string> matched_channels;            ///< Topic hex strings.
    utils::LineFramer framer;
};

class PeerRegistry
{
  public:
    using MessageHandler = std::function<void(const std::string &identity, const MsgRecord &)>;

    PeerRegistry(utils::EventLoop &loop, ChannelRegistry &channels, std::string instance_id,
                 size_t max_peer_buffer, size_t max_message_size);
    ~PeerRegistry();

    PeerRegistry(const PeerRegistry &) = delete;
    PeerRegistry &operator=(const PeerRegistry &) = delete;

    void set_message_handler(MessageHandler handler) { m_on_message = std::move(handler); }

    /// Takes ownership of a new mesh connection and sends it our hello.
    void add_connection(std::unique_ptr<MeshConnection> conn);

    /// Sends the current topic set to every writable peer and late-matches topics the
    /// peers already announced.
    void reannounce();

    /// Writes @p bytes to a writable peer. False if the peer is gone or not writable.
    bool send_to(const std::string &identity, std::string_view bytes);

    /// Closes and forgets every peer.
    void close_all();

    [[nodiscard]] const PeerEntry *find(const std::string &identity) const;
    [[nodiscard]] size_t size() const noexcept { return m_peers.size(); }

  private:
    void on_data(const std::string &identity, uint64_t generation, std::string_view bytes);
    void on_closed(const std::string &identity, uint64_t generation);
    void handle_hello(PeerEntry &peer, const HelloRecord &hello);
    void drop_peer(const std::string &identity, bool close_connection);
    PeerEntry *find_live(const std::string &identity, uint64_t generation);

    utils::EventLoop &m_loop;
    ChannelRegistry &m_channels;
    std::string m_instance_id;
    size_t m_max_peer_buffer;
    size_t m_max_message_size;
    MessageHandler m_on_message;

    std::map<std::string, std::unique_ptr<PeerEntry>> m_peers;
    std::vector<std::unique_ptr<PeerEntry>> m_graveyard;
    bool m_reap_posted = false;
    uint64_t m_next_generation = 1;
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};

} // namespace walkie::daemon
