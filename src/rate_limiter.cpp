/// \file rate_limiter.cpp
/// \brief Implementation of logx::RateLimiter.

#include <logx/rate_limiter.hpp>
#include <logx/diagnostics.hpp>

#include <string>

namespace logx {

RateLimiter::RateLimiter(const Clock& clock, std::size_t max_keys)
    : clock_(&clock), max_keys_(max_keys) {}

bool RateLimiter::should_emit(std::string_view key, double min_interval) {
    const double now = clock_->now();

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        if (max_keys_ > 0 && entries_.size() >= max_keys_)
            evict_oldest();
        entries_.emplace(std::string(key), RateLimitEntry{now, 0});
        return true;
    }

    RateLimitEntry& entry = it->second;
    if (min_interval <= 0.0 || now - entry.last_emit_time >= min_interval) {
        entry.last_emit_time = now;
        entry.suppressed_count = 0;
        return true;
    }

    ++entry.suppressed_count;
    return false;
}

std::uint32_t RateLimiter::suppressed_count(std::string_view key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? 0 : it->second.suppressed_count;
}

bool RateLimiter::contains(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

void RateLimiter::clear() {
    entries_.clear();
}

void RateLimiter::evict_oldest() {
    auto oldest = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->second.last_emit_time < oldest->second.last_emit_time)
            oldest = it;
    }
    if (oldest == entries_.end())
        return;

    diagnostics::log(diagnostics::LogLevel::Debug, "rate_limiter",
                     "key cap " + std::to_string(max_keys_) + " reached, evicting \""
                         + oldest->first + "\"");
    entries_.erase(oldest);
}

} // namespace logx
