/// \file runtime.hpp
/// \brief Explicitly constructed owner of the state shared by all loggers.
///
/// One Runtime per application run (or per test). It owns the rate limiter,
/// context stack, and channel registry, and references the sink and clock.
/// Loggers hold a reference to it, so it must outlive them.

#ifndef LOGX_RUNTIME_HPP
#define LOGX_RUNTIME_HPP

#include <logx/clock.hpp>
#include <logx/context.hpp>
#include <logx/core.hpp>
#include <logx/error.hpp>
#include <logx/rate_limiter.hpp>
#include <logx/registry.hpp>
#include <logx/sink.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace logx {

class Runtime {
public:
    explicit Runtime(Sink& sink, RuntimeOptions options = {});
    Runtime(Sink& sink, const Clock& clock, RuntimeOptions options = {});

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    /// Global gate evaluated before any per-logger check.
    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    void set_enabled(bool enabled) noexcept { enabled_ = enabled; }

    Sink& sink() noexcept { return *sink_; }
    void set_sink(Sink& sink) noexcept { sink_ = &sink; }

    const Clock& clock() const noexcept { return *clock_; }
    RateLimiter& rate_limiter() noexcept { return limiter_; }
    ContextStack& context() noexcept { return context_; }
    ChannelRegistry& channels() noexcept { return channels_; }
    const ChannelRegistry& channels() const noexcept { return channels_; }

    [[nodiscard]] Environment environment() const noexcept { return channels_.environment(); }

    /// Enter a context label for the lifetime of the returned guard.
    [[nodiscard]] ScopedContext scope(std::string name) {
        return ScopedContext(context_, std::move(name));
    }

    /// Callback that pauses the interactive host (e.g. an editor's play mode).
    void set_pause_handler(std::function<void()> handler) { pause_handler_ = std::move(handler); }

    /// Unsupported outside the Editor environment, NotFound without a handler.
    Status request_pause();

    /// Forget throttling history and context labels.
    void reset();

    /// Stable identity for a new logger; never reused within this runtime.
    std::uint64_t next_logger_id() noexcept { return next_logger_id_++; }

private:
    SteadyClock           steady_clock_;
    Sink*                 sink_;
    const Clock*          clock_;
    RateLimiter           limiter_;
    ContextStack          context_;
    ChannelRegistry       channels_;
    bool                  enabled_;
    std::function<void()> pause_handler_;
    std::uint64_t         next_logger_id_{1};
};

} // namespace logx

#endif // LOGX_RUNTIME_HPP
