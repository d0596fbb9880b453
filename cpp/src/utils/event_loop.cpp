#include "utils/event_loop.hpp"
#include "wk_service.hpp"

#include <algorithm>
#include <cerrno>
#include <vector>

namespace walkie::utils
{

namespace
{
short to_poll_events(unsigned events)
{
    short out = 0;
    if (events & EventLoop::kReadable)
        out |= ZMQ_POLLIN;
    if (events & EventLoop::kWritable)
        out |= ZMQ_POLLOUT;
    return out;
}

unsigned from_poll_events(short revents)
{
    unsigned out = 0;
    if (revents & ZMQ_POLLIN)
        out |= EventLoop::kReadable;
    if (revents & ZMQ_POLLOUT)
        out |= EventLoop::kWritable;
    if (revents & ZMQ_POLLERR)
        out |= EventLoop::kError;
    return out;
}
} // namespace

// ============================================================================
// Watchers
// ============================================================================

void EventLoop::add_fd(int fd, unsigned events, IoCallback cb)
{
    m_fd_watchers[fd] = Watcher{events, m_next_generation++,
                                std::make_shared<IoCallback>(std::move(cb))};
}

void EventLoop::update_fd(int fd, unsigned events)
{
    auto it = m_fd_watchers.find(fd);
    if (it != m_fd_watchers.end())
    {
        it->second.events = events;
    }
}

void EventLoop::remove_fd(int fd)
{
    m_fd_watchers.erase(fd);
}

void EventLoop::add_socket(zmq::socket_t &socket, IoCallback cb)
{
    m_socket_watchers[socket.handle()] = Watcher{
        kReadable, m_next_generation++, std::make_shared<IoCallback>(std::move(cb))};
}

void EventLoop::remove_socket(zmq::socket_t &socket)
{
    m_socket_watchers.erase(socket.handle());
}

// ============================================================================
// Timers and tasks
// ============================================================================

EventLoop::TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task cb)
{
    const TimerId id = m_next_timer_id++;
    const auto deadline = Clock::now() + std::max(delay, std::chrono::milliseconds(0));
    m_timers.emplace(std::make_pair(deadline, id), std::move(cb));
    m_timer_index.emplace(id, deadline);
    return id;
}

bool EventLoop::cancel(TimerId id)
{
    auto it = m_timer_index.find(id);
    if (it == m_timer_index.end())
    {
        return false;
    }
    m_timers.erase(std::make_pair(it->second, id));
    m_timer_index.erase(it);
    return true;
}

void EventLoop::post(Task cb)
{
    m_posted.push_back(std::move(cb));
}

// ============================================================================
// Iteration
// ============================================================================

std::chrono::milliseconds EventLoop::compute_poll_timeout(std::chrono::milliseconds max_wait) const
{
    if (!m_posted.empty())
    {
        return std::chrono::milliseconds(0);
    }
    auto timeout = std::max(max_wait, std::chrono::milliseconds(0));
    if (!m_timers.empty())
    {
        const auto until_next = std::chrono::ceil<std::chrono::milliseconds>(
            m_timers.begin()->first.first - Clock::now());
        timeout = std::clamp(until_next, std::chrono::milliseconds(0), timeout);
    }
    return timeout;
}

void EventLoop::dispatch_io(std::chrono::milliseconds timeout)
{
    struct Entry
    {
        bool is_socket;
        int fd;
        void *socket;
        uint64_t generation;
    };

    std::vector<zmq::pollitem_t> items;
    std::vector<Entry> entries;
    items.reserve(m_fd_watchers.size() + m_socket_watchers.size());
    entries.reserve(items.capacity());

    for (const auto &[handle, watcher] : m_socket_watchers)
    {
        items.push_back({handle, 0, to_poll_events(watcher.events), 0});
        entries.push_back({true, -1, handle, watcher.generation});
    }
    for (const auto &[fd, watcher] : m_fd_watchers)
    {
        if (watcher.events == 0)
        {
            continue;
        }
        items.push_back({nullptr, fd, to_poll_events(watcher.events), 0});
        entries.push_back({false, fd, nullptr, watcher.generation});
    }

    try
    {
        zmq::poll(items, timeout);
    }
    catch (const zmq::error_t &e)
    {
        if (e.num() == EINTR)
        {
            return;
        }
        throw;
    }

    for (size_t i = 0; i < items.size(); ++i)
    {
        if (items[i].revents == 0)
        {
            continue;
        }
        const Entry &entry = entries[i];
        std::shared_ptr<IoCallback> cb;
        if (entry.is_socket)
        {
            auto it = m_socket_watchers.find(entry.socket);
            if (it != m_socket_watchers.end() && it->second.generation == entry.generation)
                cb = it->second.cb;
        }
        else
        {
            auto it = m_fd_watchers.find(entry.fd);
            if (it != m_fd_watchers.end() && it->second.generation == entry.generation)
                cb = it->second.cb;
        }
        if (cb)
        {
            (*cb)(from_poll_events(items[i].revents));
        }
    }
}

void EventLoop::run_due_timers()
{
    // Only timers already due on entry run now; timers they schedule wait for the next pass.
    const auto now = Clock::now();
    std::vector<TimerId> due;
    for (const auto &[key, task] : m_timers)
    {
        if (key.first > now)
            break;
        due.push_back(key.second);
    }

    for (TimerId id : due)
    {
        auto idx = m_timer_index.find(id);
        if (idx == m_timer_index.end())
        {
            continue; // cancelled by an earlier timer in this batch
        }
        auto node = m_timers.extract(std::make_pair(idx->second, id));
        m_timer_index.erase(idx);
        if (!node.empty() && node.mapped())
        {
            node.mapped()();
        }
    }
}

void EventLoop::run_posted_tasks()
{
    std::deque<Task> batch;
    batch.swap(m_posted);
    for (auto &task : batch)
    {
        if (task)
        {
            task();
        }
    }
}

void EventLoop::run_once(std::chrono::milliseconds max_wait)
{
    dispatch_io(compute_poll_timeout(max_wait));
    run_due_timers();
    run_posted_tasks();
}

void EventLoop::run()
{
    while (!stop_requested())
    {
        run_once(kMaxPollInterval);
    }
    m_stop_requested.store(false, std::memory_order_relaxed);
}

void EventLoop::run_for(std::chrono::milliseconds duration)
{
    const auto deadline = Clock::now() + duration;
    while (!stop_requested())
    {
        const auto remaining =
            std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining <= std::chrono::milliseconds(0))
        {
            break;
        }
        run_once(std::min(remaining, kMaxPollInterval));
    }
    m_stop_requested.store(false, std::memory_order_relaxed);
}

bool EventLoop::run_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout)
{
    const auto deadline = Clock::now() + timeout;
    while (!pred())
    {
        if (stop_requested())
        {
            m_stop_requested.store(false, std::memory_order_relaxed);
            return pred();
        }
        const auto remaining =
            std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining <= std::chrono::milliseconds(0))
        {
            return pred();
        }
        run_once(std::min(remaining, kMaxPollInterval));
    }
    return true;
}

} // namespace walkie::utils
