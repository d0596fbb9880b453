#pragma once
/**
 * @file loopback_mesh.hpp
 * @brief In-process mesh substrate.
 *
 * Every `LoopbackMesh` registered on one `LoopbackNetwork` is a "machine". Two meshes
 * get exactly one connection pair once they have joined a common topic, mirroring a
 * DHT swarm where peers meet through a shared topic. Writes and events are delivered
 * through `EventLoop::post`, never re-entrantly.
 */
#include "mesh.hpp"

#include "utils/event_loop.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace walkie::daemon
{

class LoopbackMesh;
struct LoopbackPipe;

class LoopbackNetwork
{
  public:
    explicit LoopbackNetwork(utils::EventLoop &loop) : m_loop(loop) {}

    LoopbackNetwork(const LoopbackNetwork &) = delete;
    LoopbackNetwork &operator=(const LoopbackNetwork &) = delete;

    [[nodiscard]] utils::EventLoop &loop() noexcept { return m_loop; }

    /**
     * @brief Opens a raw connection to @p target, which sees a peer named @p identity.
     *
     * The returned end is driven directly by the caller (tests use it to speak the
     * wire protocol byte by byte).
     */
    std::unique_ptr<MeshConnection> connect_raw(LoopbackMesh &target, const std::string &identity);

    /// Number of live connection pairs.
    [[nodiscard]] size_t live_links() const;

  private:
    friend class LoopbackMesh;

    void attach(LoopbackMesh *mesh);
    void detach(LoopbackMesh *mesh);
    void topic_joined(LoopbackMesh *mesh, const TopicId &topic);

    utils::EventLoop &m_loop;
    std::vector<LoopbackMesh *> m_meshes;
    std::map<std::pair<uint64_t, uint64_t>, std::weak_ptr<LoopbackPipe>> m_links;
    uint64_t m_next_mesh_id = 1;
};

class LoopbackMesh : public MeshSubstrate
{
  public:
    /// @param identity Stable identity; a random 64-hex-character key if empty.
    explicit LoopbackMesh(LoopbackNetwork &network, std::string identity = {});
    ~LoopbackMesh() override;

    void start(ConnectionCallback on_connection) override;
    [[nodiscard]] std::unique_ptr<DiscoveryHandle> join(const TopicId &topic) override;
    void shutdown() override;
    [[nodiscard]] std::string local_identity() const override { return m_identity; }

    [[nodiscard]] bool has_topic(const TopicId &topic) const;

  private:
    friend class LoopbackNetwork;
    class Discovery;

    void release_topic(const TopicId &topic);
    void accept(std::unique_ptr<MeshConnection> conn);

    LoopbackNetwork &m_network;
    std::string m_identity;
    uint64_t m_mesh_id = 0;
    bool m_started = false;
    bool m_shut_down = false;
    ConnectionCallback m_on_connection;
    std::multiset<TopicId> m_topics;
    std::vector<std::pair<std::weak_ptr<LoopbackPipe>, int>> m_pipes; ///< (pipe, our side)
    std::shared_ptr<bool> m_alive = std::make_shared<bool>(true);
};

} // namespace walkie::daemon
