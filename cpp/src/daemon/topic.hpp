#pragma once
/**
 * @file topic.hpp
 * @brief Channel name + shared secret -> 32-byte mesh topic.
 *
 * topic = Argon2id(password = secret, salt = BLAKE2b-128("walkie:v1:" + name)).
 * The label makes topics of different channel names unrelated even when a secret
 * is reused; only daemons that know both the name and the secret meet on the mesh.
 */
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace walkie::daemon
{

inline constexpr size_t kTopicBytes = 32;
inline constexpr std::string_view kTopicLabelPrefix = "walkie:v1:";

using TopicId = std::array<uint8_t, kTopicBytes>;

/// Argon2id cost parameters.
struct CryptoPolicy
{
    uint64_t opslimit = 0;
    size_t memlimit = 0;

    /// libsodium's INTERACTIVE limits; the daemon default.
    static CryptoPolicy interactive();
    /// libsodium's MIN limits; fast enough for unit tests.
    static CryptoPolicy minimal();

    bool operator==(const CryptoPolicy &) const = default;
};

/**
 * @brief Derives the mesh topic for a channel.
 * @throws std::runtime_error if the KDF fails (out of memory).
 */
TopicId derive_topic(std::string_view channel_name, std::string_view secret,
                     const CryptoPolicy &policy);

/// 64 lowercase hex characters.
std::string to_hex(const TopicId &topic);

/// Inverse of `to_hex`; nullopt unless @p hex is exactly 64 hex digits.
std::optional<TopicId> topic_from_hex(std::string_view hex);

} // namespace walkie::daemon
