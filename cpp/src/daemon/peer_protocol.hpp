#pragma once
/**
 * @file peer_protocol.hpp
 * @brief Daemon-to-daemon wire records: newline-delimited JSON.
 *
 * ```
 * {"t":"hello","topics":["<64 hex>", ...],"id":"<instance id>"}
 * {"t":"msg","topic":"<64 hex>","data":"<payload>","id":"<instance id>","ts":<epoch ms>}
 * ```
 *
 * Decoding never throws: anything malformed, of an unknown type, or carrying an
 * oversized payload decodes to `std::nullopt` and is dropped by the caller.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace walkie::daemon
{

struct HelloRecord
{
    std::vector<std::string> topics;
    std::string id;
};

struct MsgRecord
{
    std::string topic;
    std::string data;
    std::string id; ///< Empty if the sender did not identify itself.
    int64_t ts = 0;
};

using PeerRecord = std::variant<HelloRecord, MsgRecord>;

/// Encoded record including the trailing '\n'.
std::string encode_hello(const std::vector<std::string> &topics, const std::string &id);
std::string encode_msg(const std::string &topic, const std::string &data, const std::string &id,
                       int64_t ts);

/**
 * @brief Decodes one line (without its terminator).
 * @param max_message_size `msg` records whose `data` exceeds this many bytes are rejected.
 */
std::optional<PeerRecord> parse_record(std::string_view line, size_t max_message_size);

} // namespace walkie::daemon
