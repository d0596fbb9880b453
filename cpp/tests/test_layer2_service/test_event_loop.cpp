// tests/test_layer2_service/test_event_loop.cpp
/**
 * @file test_event_loop.cpp
 * @brief EventLoop timers, posted tasks, fd watchers, ZeroMQ socket watchers and stop.
 */
#include "wk_service.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace walkie::utils;
using namespace std::chrono_literals;

namespace
{
struct Pipe
{
    Pipe()
    {
        if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0)
            throw std::system_error(errno, std::generic_category(), "pipe2");
    }
    ~Pipe()
    {
        ::close(fds[0]);
        ::close(fds[1]);
    }
    int fds[2]{-1, -1};
};
} // namespace

// ============================================================================
// Timers and posted tasks
// ============================================================================

TEST(EventLoopTest, TimersFireInDeadlineOrder)
{
    EventLoop loop;
    std::vector<int> order;
    loop.schedule(30ms, [&] { order.push_back(3); });
    loop.schedule(10ms, [&] { order.push_back(1); });
    loop.schedule(20ms, [&] { order.push_back(2); });

    ASSERT_TRUE(loop.run_until([&] { return order.size() == 3; }, 2s));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop.pending_timers(), 0u);
}

TEST(EventLoopTest, CancelledTimerDoesNotFire)
{
    EventLoop loop;
    bool fired = false;
    const auto id = loop.schedule(10ms, [&] { fired = true; });
    EXPECT_TRUE(loop.cancel(id));
    EXPECT_FALSE(loop.cancel(id));

    loop.run_for(50ms);
    EXPECT_FALSE(fired);
}

TEST(EventLoopTest, TimerCanCancelLaterTimerInSameBatch)
{
    EventLoop loop;
    bool second_fired = false;
    EventLoop::TimerId second = 0;
    loop.schedule(0ms, [&] { loop.cancel(second); });
    second = loop.schedule(0ms, [&] { second_fired = true; });

    std::this_thread::sleep_for(5ms);
    loop.run_once(0ms);
    EXPECT_FALSE(second_fired);
}

TEST(EventLoopTest, PostedTasksRunInOrderOnNextIteration)
{
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] { order.push_back(1); });
    loop.post(
        [&]
        {
            order.push_back(2);
            loop.post([&] { order.push_back(3); });
        });

    loop.run_once(0ms);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    loop.run_once(0ms);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

// ============================================================================
// I/O watchers
// ============================================================================

TEST(EventLoopTest, FdWatcherSeesReadable)
{
    EventLoop loop;
    Pipe p;
    std::string received;
    loop.add_fd(p.fds[0], EventLoop::kReadable,
                [&](unsigned revents)
                {
                    ASSERT_TRUE(revents & EventLoop::kReadable);
                    char buf[16];
                    ssize_t n = ::read(p.fds[0], buf, sizeof(buf));
                    if (n > 0)
                        received.append(buf, static_cast<size_t>(n));
                });

    ASSERT_EQ(::write(p.fds[1], "ping", 4), 4);
    ASSERT_TRUE(loop.run_until([&] { return received == "ping"; }, 1s));
}

TEST(EventLoopTest, RemovedWatcherIsNotCalled)
{
    EventLoop loop;
    Pipe p;
    int calls = 0;
    loop.add_fd(p.fds[0], EventLoop::kReadable, [&](unsigned) { ++calls; });
    loop.remove_fd(p.fds[0]);

    ASSERT_EQ(::write(p.fds[1], "x", 1), 1);
    loop.run_for(30ms);
    EXPECT_EQ(calls, 0);
}

TEST(EventLoopTest, WatcherWithNoEventsIsSkipped)
{
    EventLoop loop;
    Pipe p;
    int calls = 0;
    loop.add_fd(p.fds[1], EventLoop::kWritable, [&](unsigned) { ++calls; });
    loop.run_once(0ms);
    EXPECT_EQ(calls, 1);

    loop.update_fd(p.fds[1], 0);
    loop.run_once(0ms);
    EXPECT_EQ(calls, 1);
}

TEST(EventLoopTest, ZmqSocketWatcherSeesMessage)
{
    EventLoop loop;
    zmq::socket_t pull(get_zmq_context(), zmq::socket_type::pull);
    zmq::socket_t push(get_zmq_context(), zmq::socket_type::push);
    pull.set(zmq::sockopt::linger, 0);
    push.set(zmq::sockopt::linger, 0);
    pull.bind("inproc://event-loop-test");
    push.connect("inproc://event-loop-test");

    std::string received;
    loop.add_socket(pull,
                    [&](unsigned)
                    {
                        zmq::message_t msg;
                        while (pull.recv(msg, zmq::recv_flags::dontwait))
                            received = msg.to_string();
                    });

    push.send(zmq::str_buffer("hello"), zmq::send_flags::none);
    ASSERT_TRUE(loop.run_until([&] { return received == "hello"; }, 1s));
    loop.remove_socket(pull);
}

// ============================================================================
// Stopping
// ============================================================================

TEST(EventLoopTest, RequestStopEndsRun)
{
    EventLoop loop;
    loop.schedule(20ms, [&] { loop.request_stop(); });
    const auto start = std::chrono::steady_clock::now();
    loop.run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_FALSE(loop.stop_requested());
}

TEST(EventLoopTest, StopRequestedBeforeRunIsHonoured)
{
    EventLoop loop;
    loop.request_stop();
    const auto start = std::chrono::steady_clock::now();
    loop.run();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_FALSE(loop.stop_requested());
}

TEST(EventLoopTest, RequestStopFromAnotherThread)
{
    EventLoop loop;
    std::thread stopper(
        [&]
        {
            std::this_thread::sleep_for(30ms);
            loop.request_stop();
        });
    loop.run();
    stopper.join();
    SUCCEED();
}

TEST(EventLoopTest, RunUntilTimesOut)
{
    EventLoop loop;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(loop.run_until([] { return false; }, 50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}
