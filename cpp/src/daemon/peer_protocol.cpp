#include "peer_protocol.hpp"

#include "wk_service.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>

namespace walkie::daemon
{

namespace
{
std::string dump_line(const nlohmann::json &j)
{
    // Payloads are opaque strings; invalid UTF-8 is replaced rather than rejected.
    std::string line = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    return line;
}

std::optional<PeerRecord> parse_hello(const nlohmann::json &j)
{
    HelloRecord hello;
    if (auto it = j.find("topics"); it != j.end())
    {
        if (!it->is_array())
        {
            return std::nullopt;
        }
        for (const auto &topic : *it)
        {
            if (topic.is_string())
            {
                hello.topics.push_back(topic.get<std::string>());
            }
        }
    }
    if (auto it = j.find("id"); it != j.end() && it->is_string())
    {
        hello.id = it->get<std::string>();
    }
    return hello;
}

std::optional<PeerRecord> parse_msg(const nlohmann::json &j, size_t max_message_size)
{
    auto topic = j.find("topic");
    auto data = j.find("data");
    if (topic == j.end() || !topic->is_string() || data == j.end() || !data->is_string())
    {
        return std::nullopt;
    }

    MsgRecord msg;
    msg.data = data->get<std::string>();
    if (msg.data.size() > max_message_size)
    {
        LOGGER_WARN("Dropped oversized message ({} bytes, max {})", msg.data.size(),
                    max_message_size);
        return std::nullopt;
    }
    msg.topic = topic->get<std::string>();
    if (auto id = j.find("id"); id != j.end() && id->is_string())
    {
        msg.id = id->get<std::string>();
    }
    // Integral and within int64 only; anything else leaves ts at 0.
    if (auto ts = j.find("ts"); ts != j.end())
    {
        if (ts->is_number_unsigned())
        {
            const auto value = ts->get<uint64_t>();
            if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            {
                msg.ts = static_cast<int64_t>(value);
            }
        }
        else if (ts->is_number_integer())
        {
            msg.ts = ts->get<int64_t>();
        }
    }
    return msg;
}
} // namespace

std::string encode_hello(const std::vector<std::string> &topics, const std::string &id)
{
    return dump_line(nlohmann::json{{"t", "hello"}, {"topics", topics}, {"id", id}});
}

std::string encode_msg(const std::string &topic, const std::string &data, const std::string &id,
                       int64_t ts)
{
    return dump_line(nlohmann::json{
        {"t", "msg"}, {"topic", topic}, {"data", data}, {"id", id}, {"ts", ts}});
}

std::optional<PeerRecord> parse_record(std::string_view line, size_t max_message_size)
{
    const nlohmann::json j = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
    {
        LOGGER_DEBUG("Dropped unparsable peer record ({} bytes)", line.size());
        return std::nullopt;
    }

    auto type = j.find("t");
    if (type == j.end() || !type->is_string())
    {
        return std::nullopt;
    }
    const auto &t = type->get_ref<const std::string &>();
    if (t == "hello")
    {
        return parse_hello(j);
    }
    if (t == "msg")
    {
        return parse_msg(j, max_message_size);
    }
    LOGGER_DEBUG("Dropped peer record of unknown type '{}'", t);
    return std::nullopt;
}

} // namespace walkie::daemon
