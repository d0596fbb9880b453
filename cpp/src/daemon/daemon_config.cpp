/**
 * @file daemon_config.cpp
 * @brief DaemonConfig: layered JSON/env loading and validation.
 */
#include "daemon_config.hpp"

#include "wk_service.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace walkie::daemon
{

namespace
{

constexpr size_t kZ85KeyLength = 40;

[[noreturn]] void invalid(std::string_view key, std::string_view why)
{
    throw std::runtime_error(fmt::format("Daemon config: invalid '{}': {}", key, why));
}

size_t positive_size(const nlohmann::json &j, std::string_view key)
{
    if (!j.is_number_integer() || j.get<int64_t>() <= 0)
    {
        invalid(key, "expected a positive integer");
    }
    return static_cast<size_t>(j.get<int64_t>());
}

std::chrono::milliseconds positive_millis(const nlohmann::json &j, std::string_view key)
{
    if (!j.is_number_integer() || j.get<int64_t>() <= 0)
    {
        invalid(key, "expected a positive number of milliseconds");
    }
    return std::chrono::milliseconds(j.get<int64_t>());
}

std::string string_value(const nlohmann::json &j, std::string_view key)
{
    if (!j.is_string())
    {
        invalid(key, "expected a string");
    }
    return j.get<std::string>();
}

utils::Logger::Level level_value(const std::string &name, std::string_view key)
{
    auto lvl = utils::Logger::parse_level(name);
    if (!lvl)
    {
        invalid(key, fmt::format("unknown log level '{}'", name));
    }
    return *lvl;
}

MeshPeerConfig peer_value(const nlohmann::json &j, size_t index)
{
    const std::string key = fmt::format("mesh.peers[{}]", index);
    if (!j.is_object() || !j.contains("endpoint") || !j.contains("public_key"))
    {
        invalid(key, "expected an object with 'endpoint' and 'public_key'");
    }
    MeshPeerConfig peer;
    peer.endpoint = string_value(j.at("endpoint"), key + ".endpoint");
    peer.public_key = string_value(j.at("public_key"), key + ".public_key");
    if (peer.endpoint.empty())
    {
        invalid(key + ".endpoint", "must not be empty");
    }
    if (peer.public_key.size() != kZ85KeyLength)
    {
        invalid(key + ".public_key", "expected a 40-character Z85 Curve key");
    }
    return peer;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Paths
// ---------------------------------------------------------------------------

fs::path default_daemon_dir()
{
    if (const char *env = std::getenv("WALKIE_DIR"); env != nullptr && *env != '\0')
    {
        return fs::path(env);
    }
    return fs::path(platform::get_home_directory()) / ".walkie";
}

DaemonPaths make_daemon_paths(const fs::path &dir)
{
    return DaemonPaths{.dir = dir,
                       .socket = dir / "daemon.sock",
                       .pid = dir / "daemon.pid",
                       .lock = dir / "daemon.lock",
                       .log = dir / "daemon.log",
                       .key = dir / "mesh.key"};
}

DaemonPaths DaemonConfig::paths() const
{
    return make_daemon_paths(dir);
}

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

DaemonConfig DaemonConfig::with_defaults()
{
    DaemonConfig cfg;
    cfg.dir = fs::path(platform::get_home_directory()) / ".walkie";
    return cfg;
}

void DaemonConfig::apply_json(const nlohmann::json &j)
{
    if (!j.is_object())
    {
        throw std::runtime_error("Daemon config: top level must be a JSON object");
    }

    if (j.contains("log_level"))
    {
        log_level = level_value(string_value(j.at("log_level"), "log_level"), "log_level");
    }

    if (j.contains("limits"))
    {
        const auto &l = j.at("limits");
        if (l.contains("max_ipc_buffer"))
            limits.max_ipc_buffer = positive_size(l.at("max_ipc_buffer"), "limits.max_ipc_buffer");
        if (l.contains("max_peer_buffer"))
            limits.max_peer_buffer =
                positive_size(l.at("max_peer_buffer"), "limits.max_peer_buffer");
        if (l.contains("max_message_size"))
            limits.max_message_size =
                positive_size(l.at("max_message_size"), "limits.max_message_size");
    }

    if (j.contains("read") && j.at("read").contains("default_timeout_s"))
    {
        const auto &t = j.at("read").at("default_timeout_s");
        if (!t.is_number() || t.get<double>() <= 0.0)
        {
            invalid("read.default_timeout_s", "expected a positive number of seconds");
        }
        default_read_timeout =
            std::chrono::milliseconds(static_cast<int64_t>(t.get<double>() * 1000.0));
    }

    if (j.contains("crypto"))
    {
        const auto &c = j.at("crypto");
        if (c.contains("opslimit"))
        {
            const auto ops = positive_size(c.at("opslimit"), "crypto.opslimit");
            if (ops < crypto::pwhash_opslimit_min())
                invalid("crypto.opslimit",
                        fmt::format("below libsodium minimum {}", crypto::pwhash_opslimit_min()));
            crypto_policy.opslimit = ops;
        }
        if (c.contains("memlimit"))
        {
            const auto mem = positive_size(c.at("memlimit"), "crypto.memlimit");
            if (mem < crypto::pwhash_memlimit_min())
                invalid("crypto.memlimit",
                        fmt::format("below libsodium minimum {}", crypto::pwhash_memlimit_min()));
            crypto_policy.memlimit = mem;
        }
    }

    if (j.contains("mesh"))
    {
        const auto &m = j.at("mesh");
        if (m.contains("listen"))
            mesh.listen = string_value(m.at("listen"), "mesh.listen");
        if (m.contains("keepalive_ms"))
            mesh.keepalive = positive_millis(m.at("keepalive_ms"), "mesh.keepalive_ms");
        if (m.contains("idle_timeout_ms"))
            mesh.idle_timeout = positive_millis(m.at("idle_timeout_ms"), "mesh.idle_timeout_ms");
        if (m.contains("peers"))
        {
            const auto &peers = m.at("peers");
            if (!peers.is_array())
            {
                invalid("mesh.peers", "expected an array");
            }
            mesh.peers.clear();
            for (size_t i = 0; i < peers.size(); ++i)
            {
                mesh.peers.push_back(peer_value(peers.at(i), i));
            }
        }
        if (mesh.idle_timeout <= mesh.keepalive)
        {
            invalid("mesh.idle_timeout_ms", "must be larger than mesh.keepalive_ms");
        }
    }
}

void DaemonConfig::apply_file(const fs::path &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw std::runtime_error(
            fmt::format("Daemon config: cannot open '{}'", path.string()));
    }
    nlohmann::json j;
    try
    {
        in >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(
            fmt::format("Daemon config: '{}' is not valid JSON: {}", path.string(), e.what()));
    }
    apply_json(j);
    LOGGER_DEBUG("DaemonConfig: applied {}", path.string());
}

void DaemonConfig::apply_env()
{
    if (const char *env = std::getenv("WALKIE_LOG_LEVEL"); env != nullptr && *env != '\0')
    {
        log_level = level_value(env, "WALKIE_LOG_LEVEL");
    }
    if (const char *env = std::getenv("WALKIE_MESH_LISTEN"); env != nullptr)
    {
        mesh.listen = env;
    }
}

DaemonConfig DaemonConfig::load(const std::optional<fs::path> &dir_override,
                                const std::optional<fs::path> &config_file)
{
    DaemonConfig cfg = with_defaults();
    cfg.dir = dir_override ? *dir_override : default_daemon_dir();

    if (config_file)
    {
        cfg.apply_file(*config_file);
    }
    else if (const auto implicit = cfg.dir / "config.json"; fs::exists(implicit))
    {
        cfg.apply_file(implicit);
    }

    cfg.apply_env();
    return cfg;
}

} // namespace walkie::daemon
