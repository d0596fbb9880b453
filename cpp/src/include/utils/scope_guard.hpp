#pragma once
/**
 * @file scope_guard.hpp
 * @brief Runs a noexcept cleanup on scope exit unless dismissed.
 *
 * ```cpp
 * int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
 * auto close_fd = walkie::basics::make_scope_guard([fd]() noexcept { ::close(fd); });
 * bind_or_throw(fd);
 * m_listen_fd = fd;
 * close_fd.dismiss();
 * ```
 */
#include <type_traits>
#include <utility>

namespace walkie::basics
{

template <typename Fn>
requires std::is_nothrow_invocable_v<Fn &>
class ScopeGuard
{
  public:
    explicit ScopeGuard(Fn fn) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : m_fn(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : m_fn(std::move(other.m_fn)), m_armed(std::exchange(other.m_armed, false))
    {
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    ~ScopeGuard()
    {
        if (m_armed)
            m_fn();
    }

    void dismiss() noexcept { m_armed = false; }

  private:
    Fn m_fn;
    bool m_armed = true;
};

template <typename Fn> [[nodiscard]] ScopeGuard<std::decay_t<Fn>> make_scope_guard(Fn &&fn)
{
    return ScopeGuard<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

} // namespace walkie::basics
