#pragma once
/**
 * @file message_router.hpp
 * @brief Fan-out of local messages to matched peers, and routing of inbound ones.
 */
#include "channel_registry.hpp"
#include "daemon_error.hpp"
#include "peer_protocol.hpp"
#include "peer_registry.hpp"

#include "utils/result.hpp"

#include <cstddef>
#include <string>

namespace walkie::daemon
{

class MessageRouter
{
  public:
    MessageRouter(ChannelRegistry &channels, PeerRegistry &peers, std::string instance_id,
                  size_t max_message_size);

    /**
     * @brief Sends @p payload to every matched, writable peer of @p channel.
     * @return The number of peers written to (zero is valid), `MessageTooLarge`, or
     *         `NotInChannel`. Size is checked first.
     */
    [[nodiscard]] utils::Result<size_t, DaemonError> send(const std::string &channel,
                                                          const std::string &payload);

    /// Hands an inbound record from @p identity to its channel. Unknown topics are dropped.
    void route_inbound(const std::string &identity, const MsgRecord &msg);

    [[nodiscard]] size_t max_message_size() const noexcept { return m_max_message_size; }

  private:
    ChannelRegistry &m_channels;
    PeerRegistry &m_peers;
    std::string m_instance_id;
    size_t m_max_message_size;
};

} // namespace walkie::daemon
