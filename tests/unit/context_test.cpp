/// \file context_test.cpp
/// \brief Unit tests for logx::ContextStack and logx::ScopedContext.

#include <logx/logx.hpp>
#include "../test_harness.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace {

void test_prefix_nesting() {
    SECTION("Prefix follows nesting");

    logx::ContextStack stack;
    CHECK_EQ(stack.current_prefix(), std::string());

    stack.enter("A");
    CHECK_EQ(stack.current_prefix(), std::string("[A] "));
    stack.enter("B");
    CHECK_EQ(stack.current_prefix(), std::string("[A > B] "));

    CHECK_OK(stack.exit());
    CHECK_EQ(stack.current_prefix(), std::string("[A] "));
    CHECK_OK(stack.exit());
    CHECK_EQ(stack.current_prefix(), std::string());
    CHECK(stack.empty());
}

void test_exit_on_empty() {
    SECTION("Exit without enter is a conflict");

    logx::ContextStack stack;
    CHECK_ERR(stack.exit(), logx::ErrorCategory::Conflict);
    CHECK_EQ(stack.depth(), 0u);
}

void test_deep_nesting() {
    SECTION("Deep nesting");

    logx::ContextStack stack;
    for (int i = 0; i < 64; ++i)
        stack.enter("L" + std::to_string(i));
    CHECK_EQ(stack.depth(), 64u);
    CHECK_CONTAINS(stack.current_prefix(), "[L0 > L1 > ");
    CHECK_CONTAINS(stack.current_prefix(), "L63] ");

    stack.clear();
    CHECK(stack.empty());
}

void test_scoped_guard() {
    SECTION("Scoped guard pops on scope exit");

    logx::ContextStack stack;
    {
        logx::ScopedContext outer(stack, "Load");
        CHECK(outer.active());
        {
            logx::ScopedContext inner(stack, "Parse");
            CHECK_EQ(stack.current_prefix(), std::string("[Load > Parse] "));
        }
        CHECK_EQ(stack.current_prefix(), std::string("[Load] "));
    }
    CHECK(stack.empty());
}

void test_scoped_guard_on_exception() {
    SECTION("Scoped guard pops when an exception unwinds");

    logx::ContextStack stack;
    bool caught = false;
    try {
        logx::ScopedContext guard(stack, "Risky");
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
        caught = true;
    }
    CHECK(caught);
    CHECK(stack.empty());
}

void test_scoped_guard_early_return() {
    SECTION("Scoped guard pops on early return");

    logx::ContextStack stack;
    auto work = [&](bool bail) {
        logx::ScopedContext guard(stack, "Work");
        if (bail)
            return 1;
        return 2;
    };
    CHECK_EQ(work(true), 1);
    CHECK(stack.empty());
    CHECK_EQ(work(false), 2);
    CHECK(stack.empty());
}

void test_scoped_guard_move_and_release() {
    SECTION("Moved guard exits exactly once");

    logx::ContextStack stack;
    {
        logx::ScopedContext a(stack, "Moved");
        logx::ScopedContext b(std::move(a));
        CHECK(!a.active());
        CHECK(b.active());
        CHECK_EQ(stack.depth(), 1u);

        CHECK_OK(b.release());
        CHECK(!b.active());
        CHECK(stack.empty());
        CHECK_OK(b.release());
    }
    CHECK(stack.empty());

    logx::ScopedContext idle;
    CHECK(!idle.active());
}

void test_move_assignment_releases_current() {
    SECTION("Move assignment exits the overwritten scope");

    logx::ContextStack stack;
    logx::ScopedContext first(stack, "First");
    logx::ScopedContext second(stack, "Second");
    CHECK_EQ(stack.depth(), 2u);

    // Releases "Second" (the top) and takes over "First"'s scope.
    second = std::move(first);
    CHECK_EQ(stack.depth(), 1u);
    CHECK_OK(second.release());
    CHECK(stack.empty());
}

void test_guard_outliving_reset() {
    SECTION("Guard outliving a runtime reset is an invariant failure");

    logx_test::Capture sink;
    logx::Runtime rt(sink);
    logx::diagnostics::reset_performance_counters();
    {
        auto guard = rt.scope("Combat");
        CHECK_EQ(rt.context().depth(), 1u);
        rt.reset();
        CHECK(rt.context().empty());
    }
    CHECK(rt.context().empty());
    CHECK_EQ(logx::diagnostics::performance_counters().invariant_failures, 1u);

    // A guard released before the reset reports nothing.
    {
        auto guard = rt.scope("Menu");
        CHECK_OK(guard.release());
        rt.reset();
    }
    CHECK_EQ(logx::diagnostics::performance_counters().invariant_failures, 1u);
}

} // namespace

int main() {
    test_prefix_nesting();
    test_exit_on_empty();
    test_deep_nesting();
    test_scoped_guard();
    test_scoped_guard_on_exception();
    test_scoped_guard_early_return();
    test_scoped_guard_move_and_release();
    test_move_assignment_releases_current();
    test_guard_outliving_reset();

    return logx_test::report("context_test");
}
