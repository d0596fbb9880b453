/**
 * @file logger.cpp
 * @brief Job queue and writer thread behind walkie::utils::Logger.
 *
 * Callers push jobs under one mutex; the worker swaps the whole queue out and
 * works through the batch without holding it. A job is either a record or a
 * control step (sink switch, flush) that reports back through a promise.
 * Records beyond kMaxQueued are dropped and counted; the count is logged once
 * the worker catches up.
 */
#include "wk_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <variant>

namespace walkie::utils
{

namespace
{

constexpr size_t kMaxQueued = 10000;

/// Runs on the worker with the active sink; returns the caller's result.
struct ControlJob
{
    std::function<bool(std::unique_ptr<Sink> &)> apply;
    std::promise<bool> done;
};

using Job = std::variant<LogRecord, ControlJob>;

void print_to_stderr(const LogRecord &record) noexcept
{
    try
    {
        const std::string line = Sink::render(record);
        std::fwrite(line.data(), 1, line.size(), stderr);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[logger] cannot render record: %s\n", e.what());
    }
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // namespace

struct Logger::Impl
{
    enum class State
    {
        Stopped,
        Running,
        Stopping,
    };

    std::mutex mutex;
    std::condition_variable wake;
    std::deque<Job> jobs;
    size_t queued_records = 0;
    size_t dropped = 0;
    State state = State::Stopped;

    std::atomic<Level> level{Level::L_INFO};
    std::atomic<bool> running{false};
    std::unique_ptr<Sink> sink = std::make_unique<ConsoleSink>();
    std::thread worker;

    void start();
    void stop();
    void run();
    void emit(const LogRecord &record) noexcept;
    bool control(std::function<bool(std::unique_ptr<Sink> &)> apply);
};

void Logger::Impl::start()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (state != State::Stopped)
        return;
    state = State::Running;
    worker = std::thread(&Impl::run, this);
    running.store(true, std::memory_order_release);
}

void Logger::Impl::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != State::Running)
            return;
        state = State::Stopping;
        running.store(false, std::memory_order_release);
    }
    wake.notify_one();
    if (worker.joinable())
        worker.join();

    std::lock_guard<std::mutex> lock(mutex);
    state = State::Stopped;
}

void Logger::Impl::run()
{
    std::deque<Job> batch;
    for (;;)
    {
        size_t lost = 0;
        {
            std::unique_lock<std::mutex> lock(mutex);
            wake.wait(lock, [this] { return !jobs.empty() || state == State::Stopping; });
            if (jobs.empty())
                break;
            batch.swap(jobs);
            queued_records = 0;
            lost = std::exchange(dropped, 0);
        }

        for (Job &job : batch)
        {
            if (auto *record = std::get_if<LogRecord>(&job))
            {
                emit(*record);
                continue;
            }
            auto &ctl = std::get<ControlJob>(job);
            bool ok = false;
            try
            {
                ok = ctl.apply(sink);
            }
            catch (const std::exception &e)
            {
                print_to_stderr({std::chrono::system_clock::now(), platform::get_native_thread_id(),
                                 static_cast<int>(Level::L_ERROR),
                                 std::string("logger: ") + e.what()});
            }
            ctl.done.set_value(ok);
        }
        batch.clear();

        if (lost > 0)
        {
            emit({std::chrono::system_clock::now(), platform::get_native_thread_id(),
                  static_cast<int>(Level::L_WARNING),
                  fmt::format("logger: queue full, {} record(s) dropped", lost)});
        }
    }

    try
    {
        sink->sync();
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[logger] final sync failed: %s\n", e.what());
    }
}

void Logger::Impl::emit(const LogRecord &record) noexcept
{
    try
    {
        sink->emit(record);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[logger] sink %s failed: %s\n", sink->name().c_str(), e.what());
        print_to_stderr(record);
    }
}

bool Logger::Impl::control(std::function<bool(std::unique_ptr<Sink> &)> apply)
{
    ControlJob job{std::move(apply), {}};
    std::future<bool> result = job.done.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (state != State::Running)
            return false;
        jobs.emplace_back(std::move(job));
    }
    wake.notify_one();
    return result.get();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    pImpl->stop();
}

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    static constexpr std::pair<std::string_view, Level> kNames[] = {
        {"trace", Level::L_TRACE},   {"debug", Level::L_DEBUG}, {"info", Level::L_INFO},
        {"warn", Level::L_WARNING},  {"warning", Level::L_WARNING},
        {"error", Level::L_ERROR},   {"system", Level::L_SYSTEM},
    };
    for (const auto &[text, lvl] : kNames)
    {
        if (iequals(name, text))
            return lvl;
    }
    return std::nullopt;
}

bool Logger::set_console()
{
    return pImpl->control(
        [](std::unique_ptr<Sink> &sink)
        {
            sink->sync();
            sink = std::make_unique<ConsoleSink>();
            return true;
        });
}

bool Logger::set_logfile(const std::filesystem::path &path)
{
    return pImpl->control(
        [path](std::unique_ptr<Sink> &sink)
        {
            auto next = std::make_unique<FileSink>(path);
            sink->sync();
            sink = std::move(next);
            return true;
        });
}

void Logger::flush()
{
    if (!pImpl->control(
            [](std::unique_ptr<Sink> &sink)
            {
                sink->sync();
                return true;
            }))
    {
        std::fflush(stderr);
    }
}

void Logger::set_level(Level lvl) noexcept
{
    pImpl->level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const noexcept
{
    return pImpl->level.load(std::memory_order_relaxed);
}

bool Logger::enabled(Level lvl) const noexcept
{
    return lvl >= pImpl->level.load(std::memory_order_relaxed);
}

void Logger::submit(Level lvl, std::string &&text) noexcept
{
    try
    {
        LogRecord record{std::chrono::system_clock::now(), platform::get_native_thread_id(),
                         static_cast<int>(lvl), std::move(text)};
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            if (pImpl->state == Impl::State::Running)
            {
                if (pImpl->queued_records >= kMaxQueued)
                {
                    ++pImpl->dropped;
                    return;
                }
                ++pImpl->queued_records;
                pImpl->jobs.emplace_back(std::move(record));
                pImpl->wake.notify_one();
                return;
            }
        }
        print_to_stderr(record);
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[logger] dropped a record: %s\n", e.what());
    }
}

bool Logger::lifecycle_initialized() noexcept
{
    return instance().pImpl->running.load(std::memory_order_acquire);
}

void Logger::lifecycle_start()
{
    instance().pImpl->start();
}

void Logger::lifecycle_stop()
{
    instance().pImpl->stop();
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("walkie::utils::Logger");
    module.set_startup(&Logger::lifecycle_start);
    module.set_shutdown(&Logger::lifecycle_stop, std::chrono::milliseconds(5000));
    return module;
}

} // namespace walkie::utils
