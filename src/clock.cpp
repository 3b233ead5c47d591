/// \file clock.cpp
/// \brief steady_clock-backed logx::Clock.

#include <logx/clock.hpp>

namespace logx {

SteadyClock::SteadyClock() : start_(std::chrono::steady_clock::now()) {}

double SteadyClock::now() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    return elapsed.count();
}

} // namespace logx
