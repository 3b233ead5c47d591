/// \file assertion.hpp
/// \brief Result of a logged assertion, with chainable failure actions.

#ifndef LOGX_ASSERTION_HPP
#define LOGX_ASSERTION_HPP

#include <logx/error.hpp>

#include <functional>
#include <string>
#include <utility>

namespace logx {

class Runtime;

/// Immutable outcome of Logger::assert_that.
///
/// The failure has already been logged by the time this value exists. Each
/// chained action re-checks the stored outcome; the original condition is
/// never evaluated again.
class Assertion {
public:
    Assertion(bool passed, std::string message, Runtime* runtime = nullptr)
        : passed_(passed), message_(std::move(message)), runtime_(runtime) {}

    [[nodiscard]] bool passed() const noexcept { return passed_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    explicit operator bool() const noexcept { return passed_; }

    /// Invoke \p callback iff the assertion failed.
    const Assertion& on_failure(const std::function<void()>& callback) const;

    /// Trap into an attached debugger iff the assertion failed.
    const Assertion& break_debugger() const;

    /// Ask the runtime to pause the host iff the assertion failed.
    /// Does nothing outside the Editor environment.
    const Assertion& pause_host() const;

    /// ok() when passed, otherwise a Validation error carrying the message.
    Status status() const;

private:
    bool        passed_;
    std::string message_;
    Runtime*    runtime_;
};

} // namespace logx

#endif // LOGX_ASSERTION_HPP
