#include "message_router.hpp"

#include "wk_service.hpp"

namespace walkie::daemon
{

MessageRouter::MessageRouter(ChannelRegistry &channels, PeerRegistry &peers,
                             std::string instance_id, size_t max_message_size)
    : m_channels(channels), m_peers(peers), m_instance_id(std::move(instance_id)),
      m_max_message_size(max_message_size)
{
}

utils::Result<size_t, DaemonError> MessageRouter::send(const std::string &channel,
                                                       const std::string &payload)
{
    using SendResult = utils::Result<size_t, DaemonError>;

    if (payload.size() > m_max_message_size)
    {
        return SendResult::error(DaemonError::MessageTooLarge);
    }
    const Channel *ch = m_channels.find(channel);
    if (ch == nullptr)
    {
        return SendResult::error(DaemonError::NotInChannel);
    }

    const std::string record = encode_msg(ch->topic_hex, payload, m_instance_id,
                                          platform::epoch_time_ms());
    size_t delivered = 0;
    for (const auto &peer : ch->matched_peers)
    {
        if (m_peers.send_to(peer, record))
        {
            ++delivered;
        }
    }
    LOGGER_DEBUG("Sent {} bytes on '{}' to {} peer(s)", payload.size(), channel, delivered);
    return SendResult::ok(delivered);
}

void MessageRouter::route_inbound(const std::string &identity, const MsgRecord &msg)
{
    MessageEntry entry;
    entry.from = msg.id.empty() ? std::string(format_tools::short_id(identity)) : msg.id;
    entry.data = msg.data;
    entry.ts = msg.ts;

    if (!m_channels.deliver(msg.topic, std::move(entry)))
    {
        LOGGER_DEBUG("Dropped message for unknown topic {} from peer {}",
                     format_tools::short_id(msg.topic), format_tools::short_id(identity));
    }
}

} // namespace walkie::daemon
