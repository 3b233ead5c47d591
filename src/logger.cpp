/// \file logger.cpp
/// \brief Implementation of logx::Logger.

#include <logx/logger.hpp>
#include <logx/diagnostics.hpp>
#include <logx/runtime.hpp>

#include "detail/text.hpp"

namespace logx {

namespace {

constexpr std::string_view kAssertionPrefix = "ASSERTION FAILED: ";

} // namespace

Logger::Logger(Runtime& runtime, LoggerOptions options)
    : runtime_(&runtime),
      id_(runtime.next_logger_id()),
      prefix_(std::move(options.prefix)),
      color_(options.color),
      enabled_(options.enabled),
      channel_(options.channel) {}

// ── Gates ───────────────────────────────────────────────────────────────

bool Logger::admit() const {
    using diagnostics::Suppression;

    if (!runtime_->enabled()) {
        diagnostics::note_suppressed(Suppression::GlobalDisabled);
        return false;
    }
    if (!enabled_) {
        diagnostics::note_suppressed(Suppression::InstanceDisabled);
        return false;
    }
    if (!runtime_->channels().is_enabled(channel_)) {
        diagnostics::note_suppressed(Suppression::Channel);
        return false;
    }
    return true;
}

void Logger::deliver(std::string_view message, Level level, const void* target) {
    std::string text;
    if (!prefix_.empty()) {
        text += prefix_;
        text += ":: ";
    }
    text += runtime_->context().current_prefix();
    text += message;

    Record record{std::move(text), level, color_, channel_, runtime_->clock().now(), target};
    runtime_->sink().write(record);
    diagnostics::note_emitted();
}

// ── Emission ────────────────────────────────────────────────────────────

void Logger::emit(std::string_view message, Level level, const void* target) {
    if (!admit())
        return;
    deliver(message, level, target);
}

void Logger::log_if(bool condition, std::string_view message, Level level, const void* target) {
    if (condition)
        emit(message, level, target);
}

void Logger::log_if(const std::function<bool()>& condition,
                    const std::function<std::string()>& message,
                    Level level, const void* target) {
    if (!condition || !condition())
        return;
    if (!message || !admit())
        return;
    deliver(message(), level, target);
}

void Logger::log_throttled(std::string_view message, double min_interval,
                           Level level, const void* target) {
    throttle(throttle_key(message), message, min_interval, level, target);
}

void Logger::log_throttled(std::string_view message, Level level, const void* target) {
    const Settings* settings = runtime_->channels().settings();
    const double interval = settings != nullptr ? settings->default_rate_limit_seconds
                                                : kDefaultRateLimitSeconds;
    log_throttled(message, interval, level, target);
}

void Logger::log_throttled_as(std::string_view key, std::string_view message,
                              double min_interval, Level level, const void* target) {
    throttle(key, message, min_interval, level, target);
}

std::string Logger::throttle_key(std::string_view message) const {
    std::string key = std::to_string(id_);
    key += '_';
    key += message;
    return key;
}

void Logger::throttle(std::string_view key, std::string_view message, double min_interval,
                      Level level, const void* target) {
    if (!admit())
        return;

    const Settings* settings = runtime_->channels().settings();
    if (settings != nullptr && !settings->enable_rate_limiting) {
        deliver(message, level, target);
        return;
    }

    // Read before should_emit(): acceptance resets the count.
    RateLimiter& limiter = runtime_->rate_limiter();
    const std::uint32_t dropped = limiter.suppressed_count(key);
    if (!limiter.should_emit(key, min_interval)) {
        diagnostics::note_suppressed(diagnostics::Suppression::RateLimit);
        return;
    }

    if (dropped == 0) {
        deliver(message, level, target);
        return;
    }
    std::string annotated(message);
    annotated += " (suppressed " + std::to_string(dropped) + "x)";
    deliver(annotated, level, target);
}

// ── Assertions ──────────────────────────────────────────────────────────

Assertion Logger::assert_that(bool condition, std::string_view message) {
    if (!condition) {
        diagnostics::note_assertion_failure();
        std::string text(kAssertionPrefix);
        text += message;
        emit(text, Level::Error);
    }
    return Assertion(condition, std::string(message), runtime_);
}

Assertion Logger::validate_range(double value, double min, double max, std::string_view name) {
    if (min > max) {
        return assert_that(false, std::string(name) + " has an invalid range: min "
                                      + detail::format_number(min) + " exceeds max "
                                      + detail::format_number(max));
    }
    return assert_that(value >= min && value <= max,
                       std::string(name) + " must be between " + detail::format_number(min)
                           + " and " + detail::format_number(max) + ", but was "
                           + detail::format_number(value));
}

} // namespace logx
