#pragma once

#include <concepts>
#include <cstdio>
#include <functional>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace ctxhub::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a cleanup action when the enclosing scope is left, unless dismissed.
 *
 * Covers resources that have no RAII owner of their own: raw descriptors, flock
 * holds, the temporary file of an atomic rename. Call dismiss() once the work is
 * committed; the guard then does nothing.
 *
 * @code
 *  auto unlink_tmp = ctxhub::basics::make_scope_guard([&] { ::unlink(tmp.c_str()); });
 *  write_all(tmp);
 *  std::filesystem::rename(tmp, target);
 *  unlink_tmp.dismiss();
 * @endcode
 *
 * Move-only. A std::exception thrown by the action is printed to stderr and dropped.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard stores its action by value.");

  public:
    explicit ScopeGuard(Callable action) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_action(std::move(action))
    {
    }

    ScopeGuard(ScopeGuard &&from) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_action(std::move(from.m_action)), m_armed(std::exchange(from.m_armed, false))
    {
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    ~ScopeGuard() noexcept { invoke(); }

    /// True while the action is still pending.
    [[nodiscard]] explicit operator bool() const noexcept { return m_armed; }

    void dismiss() noexcept { m_armed = false; }

    /// Runs the action now (at most once) and disarms the guard.
    void invoke() noexcept
    {
        if (!std::exchange(m_armed, false))
        {
            return;
        }
        try
        {
            std::invoke(m_action);
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[ScopeGuard] cleanup action threw: {}\n", e.what());
        }
    }

  private:
    Callable m_action;
    bool m_armed{true};
};

/// Deduces the action type; the callable is decayed and stored by value.
template <typename F> ScopeGuard<std::decay_t<F>> make_scope_guard(F &&action)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(action));
}

} // namespace ctxhub::basics
