#pragma once

/**
 * @file daemon_config.hpp
 * @brief DaemonConfig, the daemon's typed configuration, loaded in layers.
 *
 * ## Config loading, layered (priority low → high)
 *
 *  1. Built-in C++ defaults
 *  2. `<dir>/config.json` if present, or the file passed with `--config`
 *     (which must exist)
 *  3. `WALKIE_LOG_LEVEL` / `WALKIE_MESH_LISTEN` environment overrides
 *
 * The base directory is `--dir`, else `WALKIE_DIR`, else `$HOME/.walkie`.
 *
 * ## Keys
 *
 * @code{.json}
 * {
 *   "log_level": "info",
 *   "limits": { "max_ipc_buffer": 1048576, "max_peer_buffer": 1048576,
 *               "max_message_size": 262144 },
 *   "read":   { "default_timeout_s": 30 },
 *   "crypto": { "opslimit": 2, "memlimit": 67108864 },
 *   "mesh":   { "listen": "tcp://0.0.0.0:7450", "keepalive_ms": 5000,
 *               "idle_timeout_ms": 15000,
 *               "peers": [ { "endpoint": "tcp://10.0.0.2:7450", "public_key": "<z85>" } ] }
 * }
 * @endcode
 *
 * Every setter path validates; an invalid value throws `std::runtime_error` naming
 * the offending key.
 */

#include "topic.hpp"

#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace walkie::daemon
{

/// A bootstrap peer of the ZeroMQ mesh.
struct MeshPeerConfig
{
    std::string endpoint;   ///< e.g. "tcp://10.0.0.2:7450"
    std::string public_key; ///< Z85 Curve public key (40 characters)
};

struct MeshConfig
{
    std::string listen{"tcp://0.0.0.0:7450"}; ///< Empty disables listening.
    std::vector<MeshPeerConfig> peers;
    std::chrono::milliseconds keepalive{5000};
    std::chrono::milliseconds idle_timeout{15000};
    /// Largest inbound link frame; a larger one drops the connection. Not read from
    /// the config file: the daemon sets it to `limits.max_peer_buffer`. 0 = no limit.
    size_t max_frame_size = 1024 * 1024;
};

struct DaemonLimits
{
    size_t max_ipc_buffer = 1024 * 1024;
    size_t max_peer_buffer = 1024 * 1024;
    size_t max_message_size = 256 * 1024;
};

/// Files the daemon keeps in its private directory.
struct DaemonPaths
{
    std::filesystem::path dir;
    std::filesystem::path socket; ///< daemon.sock
    std::filesystem::path pid;    ///< daemon.pid
    std::filesystem::path lock;   ///< daemon.lock
    std::filesystem::path log;    ///< daemon.log
    std::filesystem::path key;    ///< mesh.key
};

class DaemonConfig
{
  public:
    std::filesystem::path dir;
    utils::Logger::Level log_level = utils::Logger::Level::L_INFO;
    DaemonLimits limits;
    std::chrono::milliseconds default_read_timeout{30000};
    CryptoPolicy crypto_policy = CryptoPolicy::interactive();
    MeshConfig mesh;

    /// Built-in defaults only; `dir` is `$HOME/.walkie`.
    static DaemonConfig with_defaults();

    /**
     * @brief Full layered load.
     * @param dir_override   `--dir`, highest priority for the base directory.
     * @param config_file    `--config`; replaces `<dir>/config.json` and must exist.
     * @throws std::runtime_error on unreadable files or invalid values.
     */
    static DaemonConfig load(const std::optional<std::filesystem::path> &dir_override,
                             const std::optional<std::filesystem::path> &config_file);

    /// Applies the recognised keys of @p j over the current values.
    void apply_json(const nlohmann::json &j);
    void apply_file(const std::filesystem::path &path);
    void apply_env();

    /// Derived file locations under `dir`.
    [[nodiscard]] DaemonPaths paths() const;
};

/// "<dir>/daemon.sock" etc. for an arbitrary base directory.
DaemonPaths make_daemon_paths(const std::filesystem::path &dir);

/// `$WALKIE_DIR`, else `$HOME/.walkie`.
std::filesystem::path default_daemon_dir();

} // namespace walkie::daemon
