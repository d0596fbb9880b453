/**
 * @file lifecycle.cpp
 * @brief ModuleDef validation, dependency ordering and deadline-bounded shutdown.
 *
 * Start order is a depth-first topological sort over the registered modules, taken
 * in registration order. Each shutdown hook runs on its own thread; when it misses
 * its deadline the thread is detached and the next module is stopped anyway.
 */
#include "wk_base.hpp"

#include "utils/lifecycle.hpp"

#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace walkie::utils
{

namespace
{

void check_name(std::string_view name, const char *what)
{
    if (name.empty())
        throw std::invalid_argument(fmt::format("Lifecycle: {} is empty", what));
    if (name.size() > ModuleDef::MAX_MODULE_NAME_LEN)
        throw std::length_error(fmt::format("Lifecycle: {} '{}...' is longer than {} characters",
                                            what, name.substr(0, 32),
                                            ModuleDef::MAX_MODULE_NAME_LEN));
}

enum class StopResult
{
    Done,
    Threw,
    TimedOut,
};

/// Runs @p hook on a helper thread. @p error receives the exception text on Threw.
StopResult stop_with_deadline(LifecycleCallback hook, std::chrono::milliseconds timeout,
                              std::string &error)
{
    if (hook == nullptr)
        return StopResult::Done;

    auto outcome = std::make_shared<std::promise<std::string>>();
    std::future<std::string> finished = outcome->get_future();
    std::thread worker(
        [hook, outcome]()
        {
            std::string what;
            try
            {
                hook();
            }
            catch (const std::exception &e)
            {
                what = *e.what() != '\0' ? e.what() : "exception without message";
            }
            outcome->set_value(std::move(what));
        });

    if (timeout.count() > 0 && finished.wait_for(timeout) != std::future_status::ready)
    {
        worker.detach();
        return StopResult::TimedOut;
    }
    worker.join();
    error = finished.get();
    return error.empty() ? StopResult::Done : StopResult::Threw;
}

} // namespace

// ============================================================================
// ModuleDef
// ============================================================================

ModuleDef::ModuleDef(std::string_view name)
{
    check_name(name, "module name");
    m_name.assign(name);
}

void ModuleDef::add_dependency(std::string_view name)
{
    if (name.empty())
        return;
    check_name(name, "dependency name");
    m_dependencies.emplace_back(name);
}

// ============================================================================
// LifecycleManager
// ============================================================================

struct LifecycleManager::Impl
{
    enum class State : uint8_t
    {
        Registered,
        Running,
        StartFailed,
        Stopped,
        StopFailed,
        StopTimedOut,
    };

    struct Entry
    {
        explicit Entry(ModuleDef &&d) : def(std::move(d)) {}
        ModuleDef def;
        State state = State::Registered;
    };

    mutable std::mutex mutex;
    std::vector<Entry> entries;
    std::vector<Entry *> start_order;
    std::atomic<bool> initialized{false};
    std::atomic<bool> finalized{false};
    std::atomic<bool> owned{false};

    void resolve_order();
    void visit(Entry &entry, const std::map<std::string_view, Entry *> &by_name,
               std::map<const Entry *, int> &mark, std::vector<std::string_view> &path);
    void stop_running();
};

void LifecycleManager::Impl::resolve_order()
{
    std::map<std::string_view, Entry *> by_name;
    for (auto &entry : entries)
    {
        if (!by_name.emplace(entry.def.name(), &entry).second)
            throw std::runtime_error("Lifecycle: duplicate module name: " + entry.def.name());
    }

    // 0 unvisited, 1 on the current path, 2 placed
    std::map<const Entry *, int> mark;
    std::vector<std::string_view> path;
    start_order.clear();
    start_order.reserve(entries.size());
    for (auto &entry : entries)
        visit(entry, by_name, mark, path);
}

void LifecycleManager::Impl::visit(Entry &entry,
                                   const std::map<std::string_view, Entry *> &by_name,
                                   std::map<const Entry *, int> &mark,
                                   std::vector<std::string_view> &path)
{
    int &state = mark[&entry];
    if (state == 2)
        return;
    path.push_back(entry.def.name());
    if (state == 1)
        throw std::runtime_error(
            fmt::format("Lifecycle: dependency cycle: {}", fmt::join(path, " -> ")));
    state = 1;

    for (const auto &dep : entry.def.dependencies())
    {
        auto it = by_name.find(dep);
        if (it == by_name.end())
            throw std::runtime_error(fmt::format("Lifecycle: '{}' depends on unknown module '{}'",
                                                 entry.def.name(), dep));
        visit(*it->second, by_name, mark, path);
    }

    mark[&entry] = 2;
    path.pop_back();
    start_order.push_back(&entry);
}

void LifecycleManager::Impl::stop_running()
{
    for (auto it = start_order.rbegin(); it != start_order.rend(); ++it)
    {
        Entry &entry = **it;
        if (entry.state != State::Running)
            continue;

        std::string error;
        switch (stop_with_deadline(entry.def.shutdown(), entry.def.shutdown_timeout(), error))
        {
        case StopResult::Done:
            entry.state = State::Stopped;
            WK_DEBUG("[lifecycle] stopped '{}'", entry.def.name());
            break;
        case StopResult::Threw:
            entry.state = State::StopFailed;
            WK_DEBUG("[lifecycle] '{}' threw on shutdown: {}", entry.def.name(), error);
            break;
        case StopResult::TimedOut:
            entry.state = State::StopTimedOut;
            WK_DEBUG("[lifecycle] '{}' exceeded its {}ms shutdown timeout", entry.def.name(),
                     entry.def.shutdown_timeout().count());
            break;
        }
    }
}

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<Impl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

void LifecycleManager::register_module(ModuleDef &&def)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized.load(std::memory_order_acquire))
        throw std::logic_error("Lifecycle: module '" + def.name() +
                               "' registered after initialization");
    pImpl->entries.emplace_back(std::move(def));
}

void LifecycleManager::initialize(std::source_location caller)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized.exchange(true, std::memory_order_acq_rel))
        return;

    WK_DEBUG("[lifecycle] pid {} initialize from {} ({}:{})", platform::get_pid(),
             caller.function_name(), format_tools::filename_only(caller.file_name()),
             caller.line());
    (void)caller;

    try
    {
        pImpl->resolve_order();
    }
    catch (const std::exception &)
    {
        pImpl->finalized.store(true, std::memory_order_release);
        throw;
    }

    for (Impl::Entry *entry : pImpl->start_order)
    {
        try
        {
            if (LifecycleCallback start = entry->def.startup(); start != nullptr)
                start();
            entry->state = Impl::State::Running;
            WK_DEBUG("[lifecycle] started '{}'", entry->def.name());
        }
        catch (const std::exception &e)
        {
            entry->state = Impl::State::StartFailed;
            pImpl->stop_running();
            pImpl->finalized.store(true, std::memory_order_release);
            throw std::runtime_error("Lifecycle: startup of module '" + entry->def.name() +
                                     "' failed: " + e.what());
        }
    }
}

void LifecycleManager::finalize(std::source_location caller)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->initialized.load(std::memory_order_acquire) ||
        pImpl->finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    WK_DEBUG("[lifecycle] finalize from {} ({}:{})", caller.function_name(),
             format_tools::filename_only(caller.file_name()), caller.line());
    (void)caller;
    pImpl->stop_running();
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized() const noexcept
{
    return pImpl->finalized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_module_started(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (const auto &entry : pImpl->entries)
    {
        if (entry.def.name() == name)
            return entry.state == Impl::State::Running;
    }
    return false;
}

bool LifecycleManager::claim_ownership() noexcept
{
    return !pImpl->owned.exchange(true, std::memory_order_acq_rel);
}

// ============================================================================
// LifecycleGuard
// ============================================================================

LifecycleGuard::LifecycleGuard(ModuleDef &&module, std::source_location caller)
    : LifecycleGuard(MakeModDefList(std::move(module)), caller)
{
}

LifecycleGuard::LifecycleGuard(std::vector<ModuleDef> &&modules, std::source_location caller)
    : m_caller(caller)
{
    auto &manager = LifecycleManager::instance();
    if (!manager.claim_ownership())
    {
        WK_DEBUG("[lifecycle] guard in {} is not the owner; {} module(s) ignored",
                 caller.function_name(), modules.size());
        return;
    }
    m_owner = true;
    for (auto &module : modules)
        manager.register_module(std::move(module));
    manager.initialize(caller);
}

LifecycleGuard::~LifecycleGuard()
{
    if (m_owner)
        LifecycleManager::instance().finalize(m_caller);
}

} // namespace walkie::utils
