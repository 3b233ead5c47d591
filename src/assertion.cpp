/// \file assertion.cpp
/// \brief Implementation of logx::Assertion chain actions.

#include <logx/assertion.hpp>
#include <logx/diagnostics.hpp>
#include <logx/runtime.hpp>

#include <csignal>

#if defined(_WIN32) && !defined(_MSC_VER)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace logx {

const Assertion& Assertion::on_failure(const std::function<void()>& callback) const {
    if (!passed_ && callback)
        callback();
    return *this;
}

const Assertion& Assertion::break_debugger() const {
    if (!passed_ && diagnostics::debugger_attached()) {
#if defined(_MSC_VER)
        __debugbreak();
#elif defined(_WIN32)
        DebugBreak();
#else
        std::raise(SIGTRAP);
#endif
    }
    return *this;
}

const Assertion& Assertion::pause_host() const {
    if (passed_ || runtime_ == nullptr || runtime_->environment() != Environment::Editor)
        return *this;
    if (auto st = runtime_->request_pause(); !st) {
        diagnostics::log(diagnostics::LogLevel::Debug, "assertion",
                         "pause request ignored: " + st.error().message);
    }
    return *this;
}

Status Assertion::status() const {
    if (passed_)
        return logx::ok();
    return std::unexpected(Error::validation("Assertion failed", message_));
}

} // namespace logx
