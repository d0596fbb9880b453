#pragma once
/**
 * @file channel_registry.hpp
 * @brief The daemon's joined channels, their buffered messages and suspended reads.
 *
 * Single-threaded access only: every method is called from the daemon's event loop.
 *
 * Per channel, `pending` and `waiters` are never both non-empty: an inbound message
 * goes to the oldest waiter if there is one, otherwise to the buffer, and a waiter is
 * only added when the buffer is empty.
 */
#include "daemon_error.hpp"
#include "mesh.hpp"
#include "topic.hpp"

#include "utils/event_loop.hpp"
#include "utils/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace walkie::daemon
{

/// One inbound message as handed to local readers.
struct MessageEntry
{
    std::string from; ///< Sender instance id (or a short peer identity).
    std::string data;
    int64_t ts = 0;   ///< Sender clock, epoch milliseconds.

    bool operator==(const MessageEntry &) const = default;
};

void to_json(nlohmann::json &j, const MessageEntry &entry);

using Messages = std::vector<MessageEntry>;
using WaiterId = uint64_t;
using ReadCallback = std::function<void(Messages)>;

struct Waiter
{
    WaiterId id = 0;
    ReadCallback resolve;
    utils::EventLoop::TimerId timer = 0;
};

struct Channel
{
    std::string name;
    TopicId topic{};
    std::string topic_hex;
    std::unique_ptr<DiscoveryHandle> discovery;
    std::set<std::string> matched_peers;
    std::deque<MessageEntry> pending;
    std::deque<Waiter> waiters;
};

struct ChannelStatus
{
    size_t peers = 0;
    size_t buffered = 0;
};

class ChannelRegistry
{
  public:
    using JoinCallback = std::function<void()>;
    /// Fired after a channel is created (`joined` = true) or removed (false).
    using MembershipListener = std::function<void(const std::string &topic_hex, bool joined)>;

    ChannelRegistry(utils::EventLoop &loop, MeshSubstrate &mesh, CryptoPolicy policy);
    ~ChannelRegistry();

    ChannelRegistry(const ChannelRegistry &) = delete;
    ChannelRegistry &operator=(const ChannelRegistry &) = delete;

    void set_membership_listener(MembershipListener listener)
    {
        m_listener = std::move(listener);
    }

    /**
     * @brief Joins @p name, calling @p on_done once the topic is discoverable.
     *
     * Already joined: @p on_done runs immediately. A join already pending for @p name
     * absorbs this one; both callbacks run when the first completes.
     *
     * @throws std::runtime_error if topic derivation fails.
     */
    void join(const std::string &name, const std::string &secret, JoinCallback on_done);

    /// Resolves the channel's waiters with no messages, withdraws its topic and removes it.
    /// Unknown names are ignored.
    void leave(const std::string &name);

    [[nodiscard]] std::map<std::string, ChannelStatus> status() const;

    /// Removes and returns every buffered message, oldest first.
    [[nodiscard]] utils::Result<Messages, DaemonError> drain(const std::string &name);

    /**
     * @brief Suspends a read until a message arrives or @p timeout elapses.
     *
     * @p resolve runs exactly once with one message or with none, unless the waiter is
     * cancelled or dropped by `release_all()` first.
     */
    [[nodiscard]] utils::Result<WaiterId, DaemonError>
    add_waiter(const std::string &name, std::chrono::milliseconds timeout, ReadCallback resolve);

    /// Drops a waiter without resolving it. Returns false if it no longer exists.
    bool cancel_waiter(WaiterId id);

    /// Hands @p entry to the oldest waiter or buffers it. False if no channel has @p topic_hex.
    bool deliver(const std::string &topic_hex, MessageEntry entry);

    /// @return true if @p peer was newly matched.
    bool match_peer(const std::string &topic_hex, const std::string &peer);
    bool unmatch_peer(const std::string &topic_hex, const std::string &peer);
    void remove_peer(const std::string &peer);

    [[nodiscard]] std::vector<std::string> topics() const;
    [[nodiscard]] const Channel *find(const std::string &name) const;
    [[nodiscard]] const Channel *find_by_topic(const std::string &topic_hex) const;
    [[nodiscard]] size_t size() const noexcept { return m_channels.size(); }
    [[nodiscard]] bool join_pending(const std::string &name) const;

    /// Shutdown: abandons pending joins and drops waiters unresolved, then withdraws
    /// every topic.
    void release_all();

  private:
    struct PendingJoin
    {
        uint64_t generation = 0;
        TopicId topic{};
        std::unique_ptr<DiscoveryHandle> discovery;
        std::vector<JoinCallback> callbacks;
    };

    void complete_join(const std::string &name, uint64_t generation);
    void on_waiter_timeout(WaiterId id);
    Channel *find_mutable_by_topic(const std::string &topic_hex);

    utils::EventLoop &m_loop;
    MeshSubstrate &m_mesh;
    CryptoPolicy m_policy;
    MembershipListener m_listener;

    std::map<std::string, Channel> m_channels;
    std::unordered_map<std::string, std::string> m_name_by_topic;
    std::map<std::string, PendingJoin> m_pending_joins;
    std::unordered_map<WaiterId, std::string> m_waiter_channel;
    uint64_t m_next_join_generation = 1;
    WaiterId m_next_waiter_id = 1;
};

} // namespace walkie::daemon
