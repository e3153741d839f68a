#pragma once
/**
 * @file scope_guard.hpp
 * @brief RAII guard that runs a callable when the enclosing scope exits.
 *
 * Used by the model layer to release a PropertyBuilder on every exit path of a
 * declaration block, including the exceptional ones.
 *
 * @code
 *  fieldkit::model::PropertyBuilder builder(ns, "p");
 *  builder.enter();
 *  auto guard = fieldkit::basics::make_scope_guard([&] { builder.exit_noexcept(); });
 *  builder.prop("speed", provider);   // may throw
 *  guard.dismiss();
 *  builder.exit();                    // normal path: errors propagate
 * @endcode
 *
 * The destructor is `noexcept`: an exception thrown by the callable during
 * stack unwinding is swallowed. Cleanup callables should report their own
 * failures (e.g. through the Logger) instead of throwing.
 *
 * Not thread-safe.
 */
#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace fieldkit::basics
{

template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard stores its callable by value.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            try
            {
                std::invoke(m_func);
            }
            catch (...)
            {
                // Destructor must not throw; see file docs.
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    /// @return true while the guard will still run its callable.
    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// Cancels the pending cleanup.
    constexpr void dismiss() noexcept { m_active = false; }

    /**
     * @brief Runs the callable now (if still active) and dismisses the guard.
     * @details Unlike the destructor, exceptions from the callable propagate.
     */
    void invoke()
    {
        if (m_active)
        {
            m_active = false;
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Creates a ScopeGuard with the callable's decayed type.
 */
template <typename F>
requires std::invocable<std::decay_t<F> &>
[[nodiscard]] auto make_scope_guard(F &&fn)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(fn));
}

} // namespace fieldkit::basics
