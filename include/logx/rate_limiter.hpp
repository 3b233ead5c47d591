/// \file rate_limiter.hpp
/// \brief Per-key emission throttling with suppressed-message accounting.
///
/// Keys are independent: throttling "a" never affects "b". The limiter holds
/// no lock; callers sharing one instance across threads must serialize.

#ifndef LOGX_RATE_LIMITER_HPP
#define LOGX_RATE_LIMITER_HPP

#include <logx/clock.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace logx {

struct RateLimitEntry {
    double        last_emit_time{0.0};
    std::uint32_t suppressed_count{0};
};

class RateLimiter {
public:
    /// \param max_keys  Upper bound on tracked keys; 0 means unbounded.
    explicit RateLimiter(const Clock& clock, std::size_t max_keys = 0);

    /// Decide whether the message identified by \p key may be emitted now.
    ///
    /// The first observation of a key always emits. Later observations emit
    /// once at least \p min_interval seconds have passed since the last
    /// accepted one; every rejection bumps the key's suppressed count and
    /// every acceptance resets it. A non-positive interval never suppresses.
    bool should_emit(std::string_view key, double min_interval);

    /// Current suppressed count for \p key, or 0 when the key is unseen.
    std::uint32_t suppressed_count(std::string_view key) const;

    /// Forget every tracked key.
    void clear();

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t max_keys() const noexcept { return max_keys_; }
    [[nodiscard]] bool contains(std::string_view key) const;

private:
    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };

    void evict_oldest();

    const Clock* clock_;
    std::size_t  max_keys_;
    std::unordered_map<std::string, RateLimitEntry, KeyHash, std::equal_to<>> entries_;
};

} // namespace logx

#endif // LOGX_RATE_LIMITER_HPP
