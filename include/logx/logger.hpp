/// \file logger.hpp
/// \brief Per-subsystem logger: prefix, color, channel, and the gate pipeline.
///
/// Every emission passes the same short-circuit gates, in order:
///   1. runtime enabled flag
///   2. logger enabled flag
///   3. channel policy (logx::ChannelRegistry)
///   4. rate limiter (throttled calls only)
/// then receives the context prefix and the logger prefix and is written to
/// the runtime's sink as "<prefix>:: [ctx > ...] <message>".

#ifndef LOGX_LOGGER_HPP
#define LOGX_LOGGER_HPP

#include <logx/assertion.hpp>
#include <logx/channel.hpp>
#include <logx/core.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace logx {

class Runtime;

/// Interval used by log_throttled(message, level) when no settings are bound.
inline constexpr double kDefaultRateLimitSeconds = 0.1;

struct LoggerOptions {
    std::string prefix;
    Color       color{colors::White};
    bool        enabled{true};
    Channel     channel{Channel::Default};
};

class Logger {
public:
    explicit Logger(Runtime& runtime, LoggerOptions options = {});

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept = default;
    Logger& operator=(Logger&&) noexcept = default;

    // ── Emission ────────────────────────────────────────────────────────

    void emit(std::string_view message, Level level = Level::Info,
              const void* target = nullptr);

    void log_if(bool condition, std::string_view message, Level level = Level::Info,
                const void* target = nullptr);

    /// Lazy variant: \p message is built only when \p condition returns true
    /// and the record would pass the enabled and channel gates.
    void log_if(const std::function<bool()>& condition,
                const std::function<std::string()>& message,
                Level level = Level::Info, const void* target = nullptr);

    /// Throttled per (logger identity, message text). After a quiet period the
    /// emitted text gains " (suppressed <N>x)" when N copies were dropped.
    void log_throttled(std::string_view message, double min_interval,
                       Level level = Level::Info, const void* target = nullptr);

    /// Throttled with the bound settings' default interval.
    void log_throttled(std::string_view message, Level level = Level::Info,
                       const void* target = nullptr);

    /// Throttled under a caller-chosen key, used verbatim. Loggers that pass
    /// the same key share one throttle window.
    void log_throttled_as(std::string_view key, std::string_view message, double min_interval,
                          Level level = Level::Info, const void* target = nullptr);

    // ── Assertions ──────────────────────────────────────────────────────

    /// Logs "ASSERTION FAILED: <message>" at Error level when \p condition
    /// is false, then returns the outcome for chaining.
    Assertion assert_that(bool condition, std::string_view message);

    template <typename Ptr>
    Assertion validate_not_null(const Ptr& ptr, std::string_view name) {
        return assert_that(ptr != nullptr, std::string(name) + " cannot be null");
    }

    /// Fails when \p value lies outside [min, max], or when min > max.
    Assertion validate_range(double value, double min, double max, std::string_view name);

    // ── Instance state ──────────────────────────────────────────────────

    void toggle_enabled(bool enabled) noexcept { enabled_ = enabled; }
    void set_prefix(std::string prefix) { prefix_ = std::move(prefix); }
    void set_color(Color color) noexcept { color_ = color; }

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }
    [[nodiscard]] Color color() const noexcept { return color_; }
    [[nodiscard]] Channel channel() const noexcept { return channel_; }
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

    /// Rate-limiter key used by log_throttled for \p message.
    std::string throttle_key(std::string_view message) const;

private:
    bool admit() const;
    void throttle(std::string_view key, std::string_view message, double min_interval,
                  Level level, const void* target);
    void deliver(std::string_view message, Level level, const void* target);

    Runtime*      runtime_;
    std::uint64_t id_;
    std::string   prefix_;
    Color         color_;
    bool          enabled_;
    Channel       channel_;
};

} // namespace logx

#endif // LOGX_LOGGER_HPP
