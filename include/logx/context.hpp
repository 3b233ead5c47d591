/// \file context.hpp
/// \brief Nested context labels prefixed onto every emitted message.
///
/// ContextStack is plain shared state without internal locking; use one per
/// logx::Runtime and serialize access if several threads log through it.

#ifndef LOGX_CONTEXT_HPP
#define LOGX_CONTEXT_HPP

#include <logx/error.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace logx {

class ContextStack {
public:
    /// Push a scope label.
    void enter(std::string name);

    /// Pop the most recently entered label. Conflict when the stack is empty.
    Status exit();

    /// "" when empty, otherwise "[outer > ... > inner] ".
    std::string current_prefix() const;

    [[nodiscard]] std::size_t depth() const noexcept { return frames_.size(); }
    [[nodiscard]] bool empty() const noexcept { return frames_.empty(); }

    /// Drop every label, e.g. between test cases or after a host reload.
    void clear() noexcept { frames_.clear(); }

private:
    std::vector<std::string> frames_;
};

// ── RAII scope guard ────────────────────────────────────────────────────

/// Enters a context on construction and exits it exactly once on
/// destruction, including early returns and exceptions.
class ScopedContext {
public:
    ScopedContext() = default;
    ScopedContext(ContextStack& stack, std::string name);
    ~ScopedContext();

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;
    ScopedContext(ScopedContext&& o) noexcept : stack_(o.stack_) { o.stack_ = nullptr; }
    ScopedContext& operator=(ScopedContext&&) noexcept;

    [[nodiscard]] bool active() const noexcept { return stack_ != nullptr; }

    /// Exit early. Subsequent calls and the destructor do nothing.
    Status release();

private:
    void release_or_report() noexcept;

    ContextStack* stack_{nullptr};
};

} // namespace logx

#endif // LOGX_CONTEXT_HPP
