/// \file clock.hpp
/// \brief Monotonic time sources used by rate limiting and record stamps.

#ifndef LOGX_CLOCK_HPP
#define LOGX_CLOCK_HPP

#include <chrono>

namespace logx {

/// Monotonic seconds since an arbitrary epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

/// Wall-independent clock backed by std::chrono::steady_clock.
/// The epoch is the moment of construction.
class SteadyClock final : public Clock {
public:
    SteadyClock();
    double now() const override;

private:
    std::chrono::steady_clock::time_point start_;
};

/// Hand-driven clock for deterministic tests and replay.
class ManualClock final : public Clock {
public:
    explicit ManualClock(double start = 0.0) : now_(start) {}

    double now() const override { return now_; }
    void set(double seconds) { now_ = seconds; }
    void advance(double seconds) { now_ += seconds; }

private:
    double now_;
};

} // namespace logx

#endif // LOGX_CLOCK_HPP
