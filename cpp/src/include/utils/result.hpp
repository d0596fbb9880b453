/**
 * @file result.hpp
 * @brief Result<T, E>: a value or a typed error, for expected failures.
 *
 * Used where the caller is expected to branch on the failure (a client asked for a
 * channel it never joined, a payload was too large, another daemon holds the lock).
 * Unexpected failures stay exceptions.
 *
 * ```cpp
 * auto sent = router.send("room", payload);
 * if (sent.is_error())
 *     return reply_error(sent.error());
 * reply_ok(sent.content());
 * ```
 *
 * The optional integer `error_code` carries context that does not fit the enum,
 * e.g. the PID of the competing daemon for an "already running" failure.
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace walkie::utils
{

template <typename T, typename E> class Result
{
    static_assert(!std::is_void_v<T>, "Result<void, E> is not supported; use a status value");

    struct Failure
    {
        E kind;
        int code;
    };

  public:
    [[nodiscard]] static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    [[nodiscard]] static Result error(E err, int code = 0)
    {
        return Result(std::in_place_index<1>, Failure{err, code});
    }

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return m_state.index() == 1; }

    /// @throws std::logic_error on an error result.
    [[nodiscard]] T &content() &
    {
        require(is_ok(), "content");
        return std::get<0>(m_state);
    }
    [[nodiscard]] const T &content() const &
    {
        require(is_ok(), "content");
        return std::get<0>(m_state);
    }
    [[nodiscard]] T &&content() &&
    {
        require(is_ok(), "content");
        return std::get<0>(std::move(m_state));
    }

    [[nodiscard]] T value_or(T fallback) const &
    {
        return is_ok() ? std::get<0>(m_state) : std::move(fallback);
    }

    /// @throws std::logic_error on a successful result.
    [[nodiscard]] E error() const
    {
        require(is_error(), "error");
        return std::get<1>(m_state).kind;
    }

    [[nodiscard]] int error_code() const
    {
        require(is_error(), "error_code");
        return std::get<1>(m_state).code;
    }

  private:
    template <size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V &&v) : m_state(tag, std::forward<V>(v))
    {
    }

    static void require(bool holds, const char *accessor)
    {
        if (!holds)
        {
            throw std::logic_error(std::string("Result::") + accessor +
                                   "() called on the wrong state");
        }
    }

    std::variant<T, Failure> m_state;
};

} // namespace walkie::utils
