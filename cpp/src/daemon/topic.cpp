#include "topic.hpp"

#include "wk_service.hpp"

#include <stdexcept>

namespace walkie::daemon
{

CryptoPolicy CryptoPolicy::interactive()
{
    return CryptoPolicy{crypto::pwhash_opslimit_interactive(),
                        crypto::pwhash_memlimit_interactive()};
}

CryptoPolicy CryptoPolicy::minimal()
{
    return CryptoPolicy{crypto::pwhash_opslimit_min(), crypto::pwhash_memlimit_min()};
}

TopicId derive_topic(std::string_view channel_name, std::string_view secret,
                     const CryptoPolicy &policy)
{
    const std::string label = fmt::format("{}{}", kTopicLabelPrefix, channel_name);

    std::array<uint8_t, crypto::PWHASH_SALT_BYTES> salt{};
    if (!crypto::compute_blake2b(salt.data(), salt.size(), label.data(), label.size()))
    {
        throw std::runtime_error("Topic derivation: BLAKE2b salt computation failed");
    }

    TopicId topic{};
    if (!crypto::derive_key(topic.data(), topic.size(), secret, salt, policy.opslimit,
                            policy.memlimit))
    {
        throw std::runtime_error(
            fmt::format("Topic derivation failed for channel '{}' (out of memory?)", channel_name));
    }
    return topic;
}

std::string to_hex(const TopicId &topic)
{
    return format_tools::bytes_to_hex(topic.data(), topic.size());
}

std::optional<TopicId> topic_from_hex(std::string_view hex)
{
    TopicId topic{};
    if (!format_tools::hex_to_bytes(hex, topic.data(), topic.size()))
    {
        return std::nullopt;
    }
    return topic;
}

} // namespace walkie::daemon
