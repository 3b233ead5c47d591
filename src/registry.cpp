/// \file registry.cpp
/// \brief Implementation of logx::ChannelRegistry.

#include <logx/registry.hpp>
#include <logx/diagnostics.hpp>

namespace logx {

bool ChannelRegistry::is_enabled(Channel channel) const {
    if (channel == Channel::Default)
        return true;

    if (settings_ == nullptr) {
        if (!warned_unbound_) {
            warned_unbound_ = true;
            diagnostics::log(diagnostics::LogLevel::Warning, "registry",
                             "no settings bound, every channel is enabled");
        }
        return true;
    }

    const ChannelConfig* config = settings_->find(channel);
    if (config == nullptr)
        return true;
    if (!config->enabled)
        return false;
    return scope_active(config->scope, environment_);
}

Result<ChannelConfig> ChannelRegistry::config(Channel channel) const {
    if (auto st = require_settings(); !st)
        return std::unexpected(st.error());
    const ChannelConfig* config = settings_->find(channel);
    if (config == nullptr)
        return std::unexpected(Error::not_found("Channel is not configured", channel_name(channel)));
    return *config;
}

Status ChannelRegistry::set_enabled(Channel channel, bool enabled) {
    if (auto st = require_settings(); !st)
        return st;
    return settings_->set_channel_enabled(channel, enabled);
}

Status ChannelRegistry::set_scope(Channel channel, Scope scope) {
    if (auto st = require_settings(); !st)
        return st;
    return settings_->set_channel_scope(channel, scope);
}

Status ChannelRegistry::set_all_enabled(bool enabled) {
    if (auto st = require_settings(); !st)
        return st;
    settings_->set_all_enabled(enabled);
    return logx::ok();
}

Status ChannelRegistry::reset_to_defaults() {
    if (auto st = require_settings(); !st)
        return st;
    settings_->initialize_defaults();
    return logx::ok();
}

Status ChannelRegistry::require_settings() const {
    if (settings_ == nullptr)
        return std::unexpected(Error::not_found("No settings bound to the channel registry"));
    return logx::ok();
}

} // namespace logx
