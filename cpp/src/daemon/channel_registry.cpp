#include "channel_registry.hpp"

#include "wk_service.hpp"

#include <algorithm>

namespace walkie::daemon
{

void to_json(nlohmann::json &j, const MessageEntry &entry)
{
    j = nlohmann::json{{"from", entry.from}, {"data", entry.data}, {"ts", entry.ts}};
}

ChannelRegistry::ChannelRegistry(utils::EventLoop &loop, MeshSubstrate &mesh, CryptoPolicy policy)
    : m_loop(loop), m_mesh(mesh), m_policy(policy)
{
}

ChannelRegistry::~ChannelRegistry()
{
    release_all();
}

// ============================================================================
// Membership
// ============================================================================

void ChannelRegistry::join(const std::string &name, const std::string &secret,
                           JoinCallback on_done)
{
    if (m_channels.count(name) != 0)
    {
        LOGGER_DEBUG("ChannelRegistry: '{}' already joined", name);
        on_done();
        return;
    }

    if (auto it = m_pending_joins.find(name); it != m_pending_joins.end())
    {
        it->second.callbacks.push_back(std::move(on_done));
        return;
    }

    const TopicId topic = derive_topic(name, secret, m_policy);
    const std::string topic_hex = to_hex(topic);
    LOGGER_INFO("Joining topic={}...", format_tools::short_id(topic_hex, 16));

    PendingJoin pending;
    pending.generation = m_next_join_generation++;
    pending.topic = topic;
    pending.discovery = m_mesh.join(topic);
    pending.callbacks.push_back(std::move(on_done));

    DiscoveryHandle *handle = pending.discovery.get();
    const uint64_t generation = pending.generation;
    m_pending_joins.emplace(name, std::move(pending));
    handle->flushed([this, name, generation] { complete_join(name, generation); });
}

void ChannelRegistry::complete_join(const std::string &name, uint64_t generation)
{
    auto it = m_pending_joins.find(name);
    if (it == m_pending_joins.end() || it->second.generation != generation)
    {
        return;
    }
    PendingJoin pending = std::move(it->second);
    m_pending_joins.erase(it);

    Channel channel;
    channel.name = name;
    channel.topic = pending.topic;
    channel.topic_hex = to_hex(pending.topic);
    channel.discovery = std::move(pending.discovery);
    const std::string topic_hex = channel.topic_hex;

    m_name_by_topic[topic_hex] = name;
    m_channels.emplace(name, std::move(channel));
    LOGGER_INFO("Topic {} flushed, discoverable", format_tools::short_id(topic_hex, 16));

    if (m_listener)
    {
        m_listener(topic_hex, true);
    }
    for (auto &cb : pending.callbacks)
    {
        if (cb)
        {
            cb();
        }
    }
}

void ChannelRegistry::leave(const std::string &name)
{
    auto node = m_channels.extract(name);
    if (node.empty())
    {
        return;
    }
    Channel &channel = node.mapped();
    m_name_by_topic.erase(channel.topic_hex);

    std::deque<Waiter> waiters;
    waiters.swap(channel.waiters);
    for (auto &waiter : waiters)
    {
        m_loop.cancel(waiter.timer);
        m_waiter_channel.erase(waiter.id);
    }
    if (channel.discovery)
    {
        channel.discovery->destroy();
    }
    LOGGER_INFO("Left channel '{}' ({} buffered message(s) discarded)", name,
                channel.pending.size());

    for (auto &waiter : waiters)
    {
        waiter.resolve({});
    }
    if (m_listener)
    {
        m_listener(channel.topic_hex, false);
    }
}

std::map<std::string, ChannelStatus> ChannelRegistry::status() const
{
    std::map<std::string, ChannelStatus> out;
    for (const auto &[name, channel] : m_channels)
    {
        out.emplace(name, ChannelStatus{channel.matched_peers.size(), channel.pending.size()});
    }
    return out;
}

// ============================================================================
// Reads
// ============================================================================

utils::Result<Messages, DaemonError> ChannelRegistry::drain(const std::string &name)
{
    auto it = m_channels.find(name);
    if (it == m_channels.end())
    {
        return utils::Result<Messages, DaemonError>::error(DaemonError::NotInChannel);
    }
    auto &pending = it->second.pending;
    Messages out(std::make_move_iterator(pending.begin()), std::make_move_iterator(pending.end()));
    pending.clear();
    return utils::Result<Messages, DaemonError>::ok(std::move(out));
}

utils::Result<WaiterId, DaemonError> ChannelRegistry::add_waiter(const std::string &name,
                                                                 std::chrono::milliseconds timeout,
                                                                 ReadCallback resolve)
{
    auto it = m_channels.find(name);
    if (it == m_channels.end())
    {
        return utils::Result<WaiterId, DaemonError>::error(DaemonError::NotInChannel);
    }

    const WaiterId id = m_next_waiter_id++;
    Waiter waiter;
    waiter.id = id;
    waiter.resolve = std::move(resolve);
    waiter.timer = m_loop.schedule(timeout, [this, id] { on_waiter_timeout(id); });
    it->second.waiters.push_back(std::move(waiter));
    m_waiter_channel.emplace(id, name);
    return utils::Result<WaiterId, DaemonError>::ok(id);
}

void ChannelRegistry::on_waiter_timeout(WaiterId id)
{
    auto idx = m_waiter_channel.find(id);
    if (idx == m_waiter_channel.end())
    {
        return;
    }
    auto ch = m_channels.find(idx->second);
    m_waiter_channel.erase(idx);
    if (ch == m_channels.end())
    {
        return;
    }

    auto &waiters = ch->second.waiters;
    auto pos = std::find_if(waiters.begin(), waiters.end(),
                            [id](const Waiter &w) { return w.id == id; });
    if (pos == waiters.end())
    {
        return;
    }
    ReadCallback resolve = std::move(pos->resolve);
    waiters.erase(pos);
    resolve({});
}

bool ChannelRegistry::cancel_waiter(WaiterId id)
{
    auto idx = m_waiter_channel.find(id);
    if (idx == m_waiter_channel.end())
    {
        return false;
    }
    auto ch = m_channels.find(idx->second);
    m_waiter_channel.erase(idx);
    if (ch == m_channels.end())
    {
        return false;
    }

    auto &waiters = ch->second.waiters;
    auto pos = std::find_if(waiters.begin(), waiters.end(),
                            [id](const Waiter &w) { return w.id == id; });
    if (pos == waiters.end())
    {
        return false;
    }
    m_loop.cancel(pos->timer);
    waiters.erase(pos);
    return true;
}

bool ChannelRegistry::deliver(const std::string &topic_hex, MessageEntry entry)
{
    Channel *channel = find_mutable_by_topic(topic_hex);
    if (channel == nullptr)
    {
        return false;
    }

    if (channel->waiters.empty())
    {
        channel->pending.push_back(std::move(entry));
        return true;
    }

    Waiter waiter = std::move(channel->waiters.front());
    channel->waiters.pop_front();
    m_loop.cancel(waiter.timer);
    m_waiter_channel.erase(waiter.id);

    Messages messages;
    messages.push_back(std::move(entry));
    waiter.resolve(std::move(messages));
    return true;
}

// ============================================================================
// Peers
// ============================================================================

bool ChannelRegistry::match_peer(const std::string &topic_hex, const std::string &peer)
{
    Channel *channel = find_mutable_by_topic(topic_hex);
    return channel != nullptr && channel->matched_peers.insert(peer).second;
}

bool ChannelRegistry::unmatch_peer(const std::string &topic_hex, const std::string &peer)
{
    Channel *channel = find_mutable_by_topic(topic_hex);
    return channel != nullptr && channel->matched_peers.erase(peer) > 0;
}

void ChannelRegistry::remove_peer(const std::string &peer)
{
    for (auto &[name, channel] : m_channels)
    {
        channel.matched_peers.erase(peer);
    }
}

// ============================================================================
// Lookup
// ============================================================================

std::vector<std::string> ChannelRegistry::topics() const
{
    std::vector<std::string> out;
    out.reserve(m_channels.size());
    for (const auto &[name, channel] : m_channels)
    {
        out.push_back(channel.topic_hex);
    }
    return out;
}

const Channel *ChannelRegistry::find(const std::string &name) const
{
    auto it = m_channels.find(name);
    return it == m_channels.end() ? nullptr : &it->second;
}

const Channel *ChannelRegistry::find_by_topic(const std::string &topic_hex) const
{
    auto it = m_name_by_topic.find(topic_hex);
    return it == m_name_by_topic.end() ? nullptr : find(it->second);
}

Channel *ChannelRegistry::find_mutable_by_topic(const std::string &topic_hex)
{
    auto it = m_name_by_topic.find(topic_hex);
    if (it == m_name_by_topic.end())
    {
        return nullptr;
    }
    auto ch = m_channels.find(it->second);
    return ch == m_channels.end() ? nullptr : &ch->second;
}

bool ChannelRegistry::join_pending(const std::string &name) const
{
    return m_pending_joins.count(name) != 0;
}

// ============================================================================
// Shutdown
// ============================================================================

void ChannelRegistry::release_all()
{
    for (auto &[name, pending] : m_pending_joins)
    {
        if (pending.discovery)
        {
            pending.discovery->destroy();
        }
    }
    m_pending_joins.clear();

    for (auto &[name, channel] : m_channels)
    {
        for (const auto &waiter : channel.waiters)
        {
            m_loop.cancel(waiter.timer);
        }
        if (channel.discovery)
        {
            channel.discovery->destroy();
        }
    }
    if (!m_channels.empty())
    {
        LOGGER_INFO("Released {} topic(s)", m_channels.size());
    }
    m_channels.clear();
    m_name_by_topic.clear();
    m_waiter_channel.clear();
}

} // namespace walkie::daemon
