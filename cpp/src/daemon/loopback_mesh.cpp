#include "loopback_mesh.hpp"

#include "wk_service.hpp"

#include <algorithm>
#include <array>

namespace walkie::daemon
{

class LoopbackConnection;

// Shared by the two ends of one in-process stream.
struct LoopbackPipe
{
    std::array<LoopbackConnection *, 2> ends{nullptr, nullptr};
    std::array<bool, 2> side_closed{false, false};

    [[nodiscard]] bool closed() const noexcept { return side_closed[0] || side_closed[1]; }
};

// ============================================================================
// LoopbackConnection
// ============================================================================

class LoopbackConnection final : public MeshConnection
{
  public:
    LoopbackConnection(utils::EventLoop &loop, std::shared_ptr<LoopbackPipe> pipe, int side,
                       std::string remote_identity)
        : m_loop(loop), m_pipe(std::move(pipe)), m_side(side),
          m_remote_identity(std::move(remote_identity))
    {
        m_pipe->ends[m_side] = this;
    }

    ~LoopbackConnection() override
    {
        close();
        m_pipe->ends[m_side] = nullptr;
    }

    const std::string &remote_identity() const noexcept override { return m_remote_identity; }

    bool writable() const noexcept override { return !m_pipe->closed(); }

    bool write(std::string_view bytes) override
    {
        if (!writable())
        {
            return false;
        }
        m_loop.post(
            [pipe = m_pipe, other = 1 - m_side, data = std::string(bytes)]
            {
                // Data written before a close still arrives, like a stream FIN.
                auto *end = pipe->ends[other];
                if (end != nullptr && !pipe->side_closed[other])
                {
                    end->emit_data(data);
                }
            });
        return true;
    }

    void close() override
    {
        if (m_pipe->side_closed[m_side])
        {
            return;
        }
        m_pipe->side_closed[m_side] = true;
        m_loop.post(
            [pipe = m_pipe, other = 1 - m_side]
            {
                auto *end = pipe->ends[other];
                if (end != nullptr && !pipe->side_closed[other])
                {
                    pipe->side_closed[other] = true;
                    end->emit_close();
                }
            });
    }

  private:
    utils::EventLoop &m_loop;
    std::shared_ptr<LoopbackPipe> m_pipe;
    int m_side;
    std::string m_remote_identity;
};

// ============================================================================
// Discovery handle
// ============================================================================

class LoopbackMesh::Discovery final : public DiscoveryHandle
{
  public:
    Discovery(LoopbackMesh &mesh, const TopicId &topic)
        : m_mesh(&mesh), m_mesh_alive(mesh.m_alive), m_topic(topic)
    {
    }

    ~Discovery() override { destroy(); }

    const TopicId &topic() const noexcept override { return m_topic; }

    void flushed(std::function<void()> cb) override
    {
        if (!*m_active || !*m_mesh_alive)
        {
            return;
        }
        m_mesh->m_network.loop().post(
            [active = m_active, cb = std::move(cb)]
            {
                if (*active)
                {
                    cb();
                }
            });
    }

    void destroy() override
    {
        if (!*m_active)
        {
            return;
        }
        *m_active = false;
        if (*m_mesh_alive)
        {
            m_mesh->release_topic(m_topic);
        }
    }

  private:
    LoopbackMesh *m_mesh;
    std::shared_ptr<bool> m_mesh_alive;
    std::shared_ptr<bool> m_active = std::make_shared<bool>(true);
    TopicId m_topic;
};

// ============================================================================
// LoopbackNetwork
// ============================================================================

void LoopbackNetwork::attach(LoopbackMesh *mesh)
{
    mesh->m_mesh_id = m_next_mesh_id++;
    m_meshes.push_back(mesh);
}

void LoopbackNetwork::detach(LoopbackMesh *mesh)
{
    m_meshes.erase(std::remove(m_meshes.begin(), m_meshes.end(), mesh), m_meshes.end());
}

size_t LoopbackNetwork::live_links() const
{
    return static_cast<size_t>(std::count_if(m_links.begin(), m_links.end(),
                                             [](const auto &entry)
                                             {
                                                 auto pipe = entry.second.lock();
                                                 return pipe && !pipe->closed();
                                             }));
}

void LoopbackNetwork::topic_joined(LoopbackMesh *mesh, const TopicId &topic)
{
    for (LoopbackMesh *other : m_meshes)
    {
        if (other == mesh || !other->m_started || other->m_shut_down || !other->has_topic(topic))
        {
            continue;
        }

        const std::pair<uint64_t, uint64_t> key = std::minmax(mesh->m_mesh_id, other->m_mesh_id);
        if (auto existing = m_links[key].lock(); existing && !existing->closed())
        {
            continue;
        }

        auto pipe = std::make_shared<LoopbackPipe>();
        m_links[key] = pipe;
        auto to_mesh = std::make_unique<LoopbackConnection>(m_loop, pipe, 0, other->m_identity);
        auto to_other = std::make_unique<LoopbackConnection>(m_loop, pipe, 1, mesh->m_identity);
        mesh->m_pipes.emplace_back(pipe, 0);
        other->m_pipes.emplace_back(pipe, 1);
        LOGGER_DEBUG("LoopbackNetwork: linking {} <-> {}", format_tools::short_id(mesh->m_identity),
                     format_tools::short_id(other->m_identity));
        mesh->accept(std::move(to_mesh));
        other->accept(std::move(to_other));
    }
}

std::unique_ptr<MeshConnection> LoopbackNetwork::connect_raw(LoopbackMesh &target,
                                                             const std::string &identity)
{
    auto pipe = std::make_shared<LoopbackPipe>();
    auto raw_end = std::make_unique<LoopbackConnection>(m_loop, pipe, 0, target.m_identity);
    auto target_end = std::make_unique<LoopbackConnection>(m_loop, pipe, 1, identity);
    target.m_pipes.emplace_back(pipe, 1);
    target.accept(std::move(target_end));
    return raw_end;
}

// ============================================================================
// LoopbackMesh
// ============================================================================

LoopbackMesh::LoopbackMesh(LoopbackNetwork &network, std::string identity)
    : m_network(network), m_identity(std::move(identity))
{
    if (m_identity.empty())
    {
        m_identity = crypto::generate_random_hex(32);
    }
    m_network.attach(this);
}

LoopbackMesh::~LoopbackMesh()
{
    shutdown();
    *m_alive = false;
    m_network.detach(this);
}

void LoopbackMesh::start(ConnectionCallback on_connection)
{
    m_on_connection = std::move(on_connection);
    m_started = true;
    for (const auto &topic : std::set<TopicId>(m_topics.begin(), m_topics.end()))
    {
        m_network.topic_joined(this, topic);
    }
}

std::unique_ptr<DiscoveryHandle> LoopbackMesh::join(const TopicId &topic)
{
    m_topics.insert(topic);
    if (m_started && !m_shut_down)
    {
        m_network.topic_joined(this, topic);
    }
    return std::make_unique<Discovery>(*this, topic);
}

bool LoopbackMesh::has_topic(const TopicId &topic) const
{
    return m_topics.find(topic) != m_topics.end();
}

void LoopbackMesh::release_topic(const TopicId &topic)
{
    if (auto it = m_topics.find(topic); it != m_topics.end())
    {
        m_topics.erase(it);
    }
}

void LoopbackMesh::accept(std::unique_ptr<MeshConnection> conn)
{
    // Connection events are asynchronous, as on a real network.
    auto holder = std::make_shared<std::unique_ptr<MeshConnection>>(std::move(conn));
    m_network.loop().post(
        [this, alive = m_alive, holder]
        {
            if (!*alive || m_shut_down || !m_on_connection)
            {
                return; // holder's destructor closes the stream
            }
            m_on_connection(std::move(*holder));
        });
}

void LoopbackMesh::shutdown()
{
    if (m_shut_down)
    {
        return;
    }
    m_shut_down = true;
    for (auto &[weak, side] : m_pipes)
    {
        auto pipe = weak.lock();
        if (pipe && pipe->ends[side] != nullptr)
        {
            pipe->ends[side]->close();
        }
    }
    m_pipes.clear();
    m_topics.clear();
}

} // namespace walkie::daemon
