#include "peer_registry.hpp"

#include "wk_service.hpp"

#include <algorithm>

namespace walkie::daemon
{

using format_tools::short_id;

PeerRegistry::PeerRegistry(utils::EventLoop &loop, ChannelRegistry &channels,
                           std::string instance_id, size_t max_peer_buffer,
                           size_t max_message_size)
    : m_loop(loop), m_channels(channels), m_instance_id(std::move(instance_id)),
      m_max_peer_buffer(max_peer_buffer), m_max_message_size(max_message_size)
{
}

PeerRegistry::~PeerRegistry()
{
    *m_alive = false;
    close_all();
}

// ============================================================================
// Connections
// ============================================================================

void PeerRegistry::add_connection(std::unique_ptr<MeshConnection> conn)
{
    const std::string identity = conn->remote_identity();
    if (m_peers.count(identity) != 0)
    {
        LOGGER_INFO("Peer {} reconnected, replacing previous connection", short_id(identity));
        drop_peer(identity, /*close_connection=*/true);
    }

    const uint64_t generation = m_next_generation++;
    conn->on_data([this, identity, generation](std::string_view bytes)
                  { on_data(identity, generation, bytes); });
    conn->on_close([this, identity, generation] { on_closed(identity, generation); });

    auto peer =
        std::make_unique<PeerEntry>(identity, generation, std::move(conn), m_max_peer_buffer);
    PeerEntry &ref = *peer;
    m_peers.emplace(identity, std::move(peer));
    LOGGER_INFO("Peer connected: {}", short_id(identity));

    if (!ref.conn->write(encode_hello(m_channels.topics(), m_instance_id)))
    {
        LOGGER_WARN("Peer {}: initial hello could not be written", short_id(identity));
    }
}

PeerEntry *PeerRegistry::find_live(const std::string &identity, uint64_t generation)
{
    auto it = m_peers.find(identity);
    if (it == m_peers.end() || it->second->generation != generation)
    {
        return nullptr;
    }
    return it->second.get();
}

const PeerEntry *PeerRegistry::find(const std::string &identity) const
{
    auto it = m_peers.find(identity);
    return it == m_peers.end() ? nullptr : it->second.get();
}

void PeerRegistry::on_data(const std::string &identity, uint64_t generation,
                           std::string_view bytes)
{
    PeerEntry *peer = find_live(identity, generation);
    if (peer == nullptr)
    {
        return;
    }

    std::vector<std::string> lines;
    if (peer->framer.feed(bytes, lines) == utils::LineFramer::Status::Overflow)
    {
        LOGGER_WARN("Peer {} exceeded buffer limit, disconnecting", short_id(identity));
        drop_peer(identity, /*close_connection=*/true);
        return;
    }

    for (const auto &line : lines)
    {
        auto record = parse_record(line, m_max_message_size);
        if (!record)
        {
            continue;
        }
        if (auto *hello = std::get_if<HelloRecord>(&*record))
        {
            handle_hello(*peer, *hello);
        }
        else if (auto *msg = std::get_if<MsgRecord>(&*record); msg != nullptr && m_on_message)
        {
            m_on_message(identity, *msg);
        }

        // A handler may have torn the peer down.
        peer = find_live(identity, generation);
        if (peer == nullptr)
        {
            return;
        }
    }
}

void PeerRegistry::on_closed(const std::string &identity, uint64_t generation)
{
    if (find_live(identity, generation) == nullptr)
    {
        return;
    }
    LOGGER_INFO("Peer disconnected: {}", short_id(identity));
    drop_peer(identity, /*close_connection=*/false);
}

void PeerRegistry::drop_peer(const std::string &identity, bool close_connection)
{
    auto node = m_peers.extract(identity);
    if (node.empty())
    {
        return;
    }
    std::unique_ptr<PeerEntry> peer = std::move(node.mapped());
    m_channels.remove_peer(identity);
    if (close_connection && peer->conn)
    {
        peer->conn->close();
    }

    m_graveyard.push_back(std::move(peer));
    if (!m_reap_posted)
    {
        m_reap_posted = true;
        m_loop.post(
            [this, alive = m_alive]
            {
                if (!*alive)
                {
                    return;
                }
                m_reap_posted = false;
                m_graveyard.clear();
            });
    }
}

// ============================================================================
// Handshake
// ============================================================================

void PeerRegistry::handle_hello(PeerEntry &peer, const HelloRecord &hello)
{
    peer.known_topics.emplace(hello.topics.begin(), hello.topics.end());
    LOGGER_INFO("Hello from peer {} with {} topic(s)", short_id(peer.identity),
                peer.known_topics->size());

    for (const auto &topic : m_channels.topics())
    {
        if (peer.known_topics->count(topic) != 0 && m_channels.match_peer(topic, peer.identity))
        {
            peer.matched_channels.insert(topic);
            LOGGER_INFO("Matched topic {} with peer {}", short_id(topic), short_id(peer.identity));
        }
    }

    for (auto it = peer.matched_channels.begin(); it != peer.matched_channels.end();)
    {
        if (peer.known_topics->count(*it) == 0)
        {
            m_channels.unmatch_peer(*it, peer.identity);
            LOGGER_INFO("Unmatched topic {} with peer {}", short_id(*it), short_id(peer.identity));
            it = peer.matched_channels.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void PeerRegistry::reannounce()
{
    const auto topics = m_channels.topics();
    const std::string hello = encode_hello(topics, m_instance_id);
    const std::set<std::string> local(topics.begin(), topics.end());

    for (auto &[identity, peer] : m_peers)
    {
        if (peer->conn->writable())
        {
            LOGGER_DEBUG("Re-announcing {} topic(s) to peer {}", topics.size(), short_id(identity));
            if (!peer->conn->write(hello))
            {
                LOGGER_WARN("Re-announce to peer {} failed", short_id(identity));
            }
        }

        // Channels we left no longer count as matched.
        for (auto it = peer->matched_channels.begin(); it != peer->matched_channels.end();)
        {
            it = local.count(*it) == 0 ? peer->matched_channels.erase(it) : std::next(it);
        }

        if (!peer->known_topics)
        {
            continue;
        }
        for (const auto &topic : topics)
        {
            if (peer->known_topics->count(topic) != 0 && m_channels.match_peer(topic, identity))
            {
                peer->matched_channels.insert(topic);
                LOGGER_INFO("Late-matched topic {} with peer {}", short_id(topic),
                            short_id(identity));
            }
        }
    }
}

// ============================================================================
// Sending and teardown
// ============================================================================

bool PeerRegistry::send_to(const std::string &identity, std::string_view bytes)
{
    auto it = m_peers.find(identity);
    if (it == m_peers.end() || !it->second->conn->writable())
    {
        return false;
    }
    return it->second->conn->write(bytes);
}

void PeerRegistry::close_all()
{
    for (auto &[identity, peer] : m_peers)
    {
        m_channels.remove_peer(identity);
        if (peer->conn)
        {
            peer->conn->close();
        }
    }
    if (!m_peers.empty())
    {
        LOGGER_INFO("Closed {} peer connection(s)", m_peers.size());
    }
    m_peers.clear();
    m_graveyard.clear();
}

} // namespace walkie::daemon
