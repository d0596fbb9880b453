#pragma once
/**
 * @file event_loop.hpp
 * @brief Single-threaded cooperative event loop over `zmq::poll`.
 *
 * One loop multiplexes ZeroMQ sockets, plain file descriptors (the control socket and
 * its clients), one-shot timers and posted tasks. Every callback runs on the thread
 * that calls `run()`, so state touched only from callbacks needs no locking.
 *
 * Iteration order: poll (timeout = min(next timer, max wait), or 0 while tasks are
 * posted) -> I/O callbacks -> due timers -> posted tasks. Watchers added or removed
 * from inside a callback take effect on the next iteration; a watcher removed during
 * the current iteration is not called again.
 *
 * ```cpp
 * EventLoop loop;
 * loop.add_fd(listen_fd, EventLoop::kReadable, [&](unsigned) { accept_clients(); });
 * auto id = loop.schedule(std::chrono::seconds(30), [&] { resolve_timeout(); });
 * loop.run(); // until request_stop()
 * ```
 */
#include "walkie_utils_export.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <unordered_map>
#include <utility>

#include <zmq.hpp>

namespace walkie::utils
{

class WALKIE_UTILS_EXPORT EventLoop
{
  public:
    static constexpr unsigned kReadable = 1;
    static constexpr unsigned kWritable = 2;
    static constexpr unsigned kError = 4;

    /// Upper bound on a single poll; also bounds the latency of `request_stop()`.
    static constexpr std::chrono::milliseconds kMaxPollInterval{100};

    using IoCallback = std::function<void(unsigned revents)>;
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop() = default;
    ~EventLoop() = default;

    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    // --- I/O watchers ---
    /// Replaces any existing watcher for @p fd.
    void add_fd(int fd, unsigned events, IoCallback cb);
    void update_fd(int fd, unsigned events);
    void remove_fd(int fd);

    /// Watches a ZeroMQ socket for readability.
    void add_socket(zmq::socket_t &socket, IoCallback cb);
    void remove_socket(zmq::socket_t &socket);

    // --- Timers and tasks ---
    TimerId schedule(std::chrono::milliseconds delay, Task cb);
    /// @return true if the timer was pending and is now cancelled.
    bool cancel(TimerId id);
    void post(Task cb);

    // --- Running ---
    /// Runs until `request_stop()`. The stop request is consumed on return.
    void run();
    /// One iteration, waiting at most @p max_wait for I/O.
    void run_once(std::chrono::milliseconds max_wait = kMaxPollInterval);
    /// Runs for @p duration, or until `request_stop()`.
    void run_for(std::chrono::milliseconds duration);
    /// Runs until @p pred is true or @p timeout elapses. Returns the last value of @p pred.
    bool run_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout);

    /// Async-signal-safe: a single atomic store.
    void request_stop() noexcept { m_stop_requested.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool stop_requested() const noexcept
    {
        return m_stop_requested.load(std::memory_order_relaxed);
    }

    [[nodiscard]] size_t pending_timers() const noexcept { return m_timer_index.size(); }

  private:
    using Clock = std::chrono::steady_clock;

    struct Watcher
    {
        unsigned events = 0;
        uint64_t generation = 0;
        std::shared_ptr<IoCallback> cb;
    };

    std::chrono::milliseconds compute_poll_timeout(std::chrono::milliseconds max_wait) const;
    void dispatch_io(std::chrono::milliseconds timeout);
    void run_due_timers();
    void run_posted_tasks();

    std::unordered_map<int, Watcher> m_fd_watchers;
    std::unordered_map<void *, Watcher> m_socket_watchers;
    uint64_t m_next_generation = 1;

    std::map<std::pair<Clock::time_point, TimerId>, Task> m_timers;
    std::unordered_map<TimerId, Clock::time_point> m_timer_index;
    TimerId m_next_timer_id = 1;

    std::deque<Task> m_posted;

    std::atomic<bool> m_stop_requested{false};
};

} // namespace walkie::utils
