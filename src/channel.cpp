/// \file channel.cpp
/// \brief Channel and scope naming helpers.

#include <logx/channel.hpp>

#include "detail/text.hpp"

#include <initializer_list>
#include <string>

namespace logx {

const char* channel_name(Channel channel) {
    switch (channel) {
        case Channel::Default:     return "Default";
        case Channel::Audio:       return "Audio";
        case Channel::Network:     return "Network";
        case Channel::Physics:     return "Physics";
        case Channel::AI:          return "AI";
        case Channel::UI:          return "UI";
        case Channel::Gameplay:    return "Gameplay";
        case Channel::Performance: return "Performance";
        case Channel::Animation:   return "Animation";
        case Channel::Input:       return "Input";
        case Channel::Rendering:   return "Rendering";
        case Channel::System:      return "System";
    }
    return "Unknown";
}

const char* scope_name(Scope scope) {
    switch (scope) {
        case Scope::EditorOnly: return "EditorOnly";
        case Scope::BuildOnly:  return "BuildOnly";
        case Scope::Both:       return "Both";
    }
    return "Unknown";
}

Result<Channel> parse_channel(std::string_view name) {
    for (Channel c : kAllChannels) {
        if (detail::iequals(name, channel_name(c)))
            return c;
    }
    return std::unexpected(Error::not_found("Unknown channel", std::string(name)));
}

Result<Scope> parse_scope(std::string_view name) {
    for (Scope s : {Scope::EditorOnly, Scope::BuildOnly, Scope::Both}) {
        if (detail::iequals(name, scope_name(s)))
            return s;
    }
    return std::unexpected(Error::not_found("Unknown scope", std::string(name)));
}

bool scope_active(Scope scope, Environment environment) {
    switch (scope) {
        case Scope::Both:       return true;
        case Scope::EditorOnly: return environment == Environment::Editor;
        case Scope::BuildOnly:  return environment == Environment::Build;
    }
    return false;
}

} // namespace logx
