/// \file core.hpp
/// \brief Shared value types and option structs used across logx domains.

#ifndef LOGX_CORE_HPP
#define LOGX_CORE_HPP

#include <cstddef>
#include <cstdint>

namespace logx {

/// Severity handed to sinks together with every record.
enum class Level {
    Info,
    Warning,
    Error,
    Fatal,
};

const char* level_name(Level level);

/// 8-bit RGB color hint. Sinks may ignore it.
struct Color {
    std::uint8_t r{255};
    std::uint8_t g{255};
    std::uint8_t b{255};

    friend bool operator==(const Color&, const Color&) = default;
};

namespace colors {
inline constexpr Color White{255, 255, 255};
inline constexpr Color Red{255, 33, 76};
inline constexpr Color Yellow{204, 153, 0};
inline constexpr Color Green{64, 200, 96};
inline constexpr Color Cyan{128, 204, 255};
} // namespace colors

/// Host environment consulted by channel scopes.
enum class Environment {
    Editor,   ///< Interactive development host.
    Build,    ///< Packaged / shipped program.
};

/// Process-level policy for one logx::Runtime.
struct RuntimeOptions {
    bool        enabled{true};                     ///< Global gate, checked first.
    Environment environment{Environment::Build};
    std::size_t max_rate_limit_keys{4096};         ///< 0 means unbounded.
};

} // namespace logx

#endif // LOGX_CORE_HPP
