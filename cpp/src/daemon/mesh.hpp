#pragma once
/**
 * @file mesh.hpp
 * @brief Abstract peer mesh substrate: topic discovery plus byte-stream connections.
 *
 * The daemon only sees these three interfaces. Implementations:
 *  - `ZmqMesh`      ZeroMQ ROUTER/DEALER over CurveZMQ, static bootstrap peers.
 *  - `LoopbackMesh` in-process, for tests and `walkied --self-test`.
 *
 * All callbacks are invoked from the daemon's event loop thread. A callback may
 * destroy neither the object that invoked it nor its substrate.
 */
#include "topic.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace walkie::daemon
{

/**
 * @class MeshConnection
 * @brief A byte stream to one remote daemon, with a stable remote identity.
 */
class MeshConnection
{
  public:
    using DataCallback = std::function<void(std::string_view bytes)>;
    using CloseCallback = std::function<void()>;

    virtual ~MeshConnection() = default;

    MeshConnection(const MeshConnection &) = delete;
    MeshConnection &operator=(const MeshConnection &) = delete;

    /// Stable identity of the remote end (its public key, as text).
    [[nodiscard]] virtual const std::string &remote_identity() const noexcept = 0;

    [[nodiscard]] virtual bool writable() const noexcept = 0;

    /// Queues @p bytes for the remote. Returns false if the stream is not writable.
    virtual bool write(std::string_view bytes) = 0;

    /// Closes the stream locally. The remote sees a close; `on_close` is not fired here.
    virtual void close() = 0;

    void on_data(DataCallback cb) { m_on_data = std::move(cb); }
    void on_close(CloseCallback cb) { m_on_close = std::move(cb); }

  protected:
    MeshConnection() = default;

    void emit_data(std::string_view bytes)
    {
        if (m_on_data)
            m_on_data(bytes);
    }
    void emit_close()
    {
        if (m_on_close)
            m_on_close();
    }

  private:
    DataCallback m_on_data;
    CloseCallback m_on_close;
};

/**
 * @class DiscoveryHandle
 * @brief Interest in one topic. Destroying the handle withdraws the interest.
 */
class DiscoveryHandle
{
  public:
    virtual ~DiscoveryHandle() = default;

    [[nodiscard]] virtual const TopicId &topic() const noexcept = 0;

    /// Calls @p cb once the topic is announced. Never called after `destroy()`.
    virtual void flushed(std::function<void()> cb) = 0;

    /// Withdraws the topic. Idempotent.
    virtual void destroy() = 0;
};

/**
 * @class MeshSubstrate
 * @brief Produces connections to remote daemons and accepts topic interest.
 */
class MeshSubstrate
{
  public:
    using ConnectionCallback = std::function<void(std::unique_ptr<MeshConnection>)>;

    virtual ~MeshSubstrate() = default;

    /**
     * @brief Begins accepting and dialing. New connections are handed to @p on_connection.
     * @throws std::runtime_error if the substrate cannot start (e.g. bind failure).
     */
    virtual void start(ConnectionCallback on_connection) = 0;

    [[nodiscard]] virtual std::unique_ptr<DiscoveryHandle> join(const TopicId &topic) = 0;

    /// Closes every link and stops producing connections. Idempotent.
    virtual void shutdown() = 0;

    /// This daemon's identity as remote peers see it.
    [[nodiscard]] virtual std::string local_identity() const = 0;
};

} // namespace walkie::daemon
