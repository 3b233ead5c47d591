/// \file context.cpp
/// \brief Implementation of logx::ContextStack and logx::ScopedContext.

#include <logx/context.hpp>
#include <logx/diagnostics.hpp>

#include <utility>

namespace logx {

// ── ContextStack ────────────────────────────────────────────────────────

void ContextStack::enter(std::string name) {
    frames_.push_back(std::move(name));
}

Status ContextStack::exit() {
    if (frames_.empty()) {
        diagnostics::log(diagnostics::LogLevel::Warning, "context",
                         "exit() without a matching enter()");
        return std::unexpected(Error::conflict("Context stack is empty"));
    }
    frames_.pop_back();
    return logx::ok();
}

std::string ContextStack::current_prefix() const {
    if (frames_.empty())
        return {};

    std::string out = "[";
    for (std::size_t i = 0; i < frames_.size(); ++i) {
        if (i > 0)
            out += " > ";
        out += frames_[i];
    }
    out += "] ";
    return out;
}

// ── ScopedContext ───────────────────────────────────────────────────────

ScopedContext::ScopedContext(ContextStack& stack, std::string name) : stack_(&stack) {
    stack_->enter(std::move(name));
}

ScopedContext::~ScopedContext() {
    release_or_report();
}

ScopedContext& ScopedContext::operator=(ScopedContext&& o) noexcept {
    if (this != &o) {
        release_or_report();
        stack_ = o.stack_;
        o.stack_ = nullptr;
    }
    return *this;
}

Status ScopedContext::release() {
    if (stack_ == nullptr)
        return logx::ok();
    ContextStack* stack = std::exchange(stack_, nullptr);
    return stack->exit();
}

void ScopedContext::release_or_report() noexcept {
    auto st = release();
    if (st)
        return;
    // The stack was cleared underneath this guard. assert_invariant logs and
    // counts the failure; there is no caller left to hand the error to.
    auto reported = diagnostics::assert_invariant(
        false, "scoped context outlived its stack entry: " + st.error().message);
    static_cast<void>(reported);
}

} // namespace logx
