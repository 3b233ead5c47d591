/// \file channel.hpp
/// \brief Log channels, activation scopes, and per-channel configuration.

#ifndef LOGX_CHANNEL_HPP
#define LOGX_CHANNEL_HPP

#include <logx/core.hpp>
#include <logx/error.hpp>

#include <array>
#include <string_view>

namespace logx {

/// Category used for independent enable/disable control.
/// Channel::Default is the always-on sentinel and is never configured.
enum class Channel {
    Default,
    Audio,
    Network,
    Physics,
    AI,
    UI,
    Gameplay,
    Performance,
    Animation,
    Input,
    Rendering,
    System,
};

inline constexpr std::array<Channel, 12> kAllChannels{
    Channel::Default,   Channel::Audio,       Channel::Network,   Channel::Physics,
    Channel::AI,        Channel::UI,          Channel::Gameplay,  Channel::Performance,
    Channel::Animation, Channel::Input,       Channel::Rendering, Channel::System,
};

/// High-volume channel that defaults to EditorOnly after a reset.
inline constexpr Channel kNoisyChannel = Channel::Performance;

/// Where a channel is active.
enum class Scope {
    EditorOnly,
    BuildOnly,
    Both,
};

struct ChannelConfig {
    Channel channel{Channel::Default};
    Scope   scope{Scope::Both};
    bool    enabled{true};
};

const char* channel_name(Channel channel);
const char* scope_name(Scope scope);

/// Case-insensitive lookup by name. NotFound for unknown names.
Result<Channel> parse_channel(std::string_view name);
Result<Scope>   parse_scope(std::string_view name);

/// True when \p scope admits records in \p environment.
bool scope_active(Scope scope, Environment environment);

} // namespace logx

#endif // LOGX_CHANNEL_HPP
