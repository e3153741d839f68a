// tests/test_layer1_base/test_scopeguard.cpp
/**
 * @file test_scopeguard.cpp
 * @brief Unit tests for the ScopeGuard class.
 *
 * Covers execution on scope exit, dismissal, move semantics, and the
 * exception contract: the destructor swallows, invoke() propagates.
 */
#include "fk_base.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <functional>
#include <stdexcept>

using fieldkit::basics::make_scope_guard;
using fieldkit::basics::ScopeGuard;

// Test that the ScopeGuard executes its function on normal scope exit.
TEST(ScopeGuardTest, ExecutesOnScopeExit)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        ASSERT_FALSE(executed);
    }
    ASSERT_TRUE(executed);
}

// Test that a guard created from an L-value lambda executes correctly.
TEST(ScopeGuardTest, ExecutesWithLvalueLambda)
{
    bool executed = false;
    auto my_lambda = [&]() { executed = true; };
    {
        auto guard = make_scope_guard(my_lambda);
        ASSERT_FALSE(executed);
    }
    ASSERT_TRUE(executed);
}

// Test that the guard runs when the scope is left by an exception.
TEST(ScopeGuardTest, ExecutesDuringUnwinding)
{
    bool executed = false;
    try
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        throw std::runtime_error("leave scope");
    }
    catch (const std::runtime_error &)
    {
    }
    ASSERT_TRUE(executed);
}

// Test that a dismissed ScopeGuard does not execute its function.
TEST(ScopeGuardTest, Dismiss)
{
    bool executed = false;
    {
        auto guard = make_scope_guard([&]() { executed = true; });
        guard.dismiss();
        guard.dismiss(); // Second call should have no effect.
        ASSERT_FALSE(executed);
    }
    ASSERT_FALSE(executed);
}

// Test that invoke() executes the function immediately and dismisses the guard.
TEST(ScopeGuardTest, InvokeRunsOnce)
{
    int execution_count = 0;
    {
        auto guard = make_scope_guard([&]() { execution_count++; });
        guard.invoke();
        ASSERT_EQ(execution_count, 1);
        guard.invoke(); // This call should do nothing.
        ASSERT_EQ(execution_count, 1);
    }
    ASSERT_EQ(execution_count, 1);
}

// Test that invoke() propagates exceptions and still dismisses the guard.
TEST(ScopeGuardTest, InvokePropagatesAndDismisses)
{
    int execution_count = 0;
    {
        auto guard = make_scope_guard(
            [&]()
            {
                execution_count++;
                throw std::runtime_error("Test Propagate");
            });
        EXPECT_THROW(guard.invoke(), std::runtime_error);
        EXPECT_FALSE(static_cast<bool>(guard));
    }
    ASSERT_EQ(execution_count, 1);
}

// Test that moving a ScopeGuard transfers ownership of the function call.
TEST(ScopeGuardTest, MovedFromGuardIsInactive)
{
    std::atomic<int> execution_count = 0;
    {
        auto guard1 = make_scope_guard([&]() { execution_count++; });
        ScopeGuard guard2(std::move(guard1));
        EXPECT_FALSE(static_cast<bool>(guard1));
        EXPECT_TRUE(static_cast<bool>(guard2));
    }
    ASSERT_EQ(execution_count.load(), 1);
}

// Test that exceptions from the guarded function are swallowed in the destructor.
TEST(ScopeGuardTest, ExceptionInDestructorIsSwallowed)
{
    auto make_and_destroy_guard = []()
    { auto guard = make_scope_guard([]() { throw std::runtime_error("Test"); }); };
    EXPECT_NO_THROW(make_and_destroy_guard());
}

// Test that the guard works with std::function.
TEST(ScopeGuardTest, CreateFromStdFunction)
{
    bool executed = false;
    std::function<void()> my_func = [&]() { executed = true; };
    {
        auto guard = make_scope_guard(my_func);
        ASSERT_FALSE(executed);
    }
    ASSERT_TRUE(executed);
}

// Statically verify the noexcept contract of the move constructor.
TEST(ScopeGuardTest, NoexceptCorrectness)
{
    auto f = []() {};
    using GuardType = decltype(make_scope_guard(f));
    static_assert(std::is_nothrow_move_constructible_v<GuardType>,
                  "ScopeGuard should be nothrow move constructible.");
    static_assert(std::is_nothrow_destructible_v<GuardType>,
                  "ScopeGuard destructor must not throw.");
}
