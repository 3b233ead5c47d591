/// \file registry.hpp
/// \brief Channel enable/scope policy consulted before every emission.

#ifndef LOGX_REGISTRY_HPP
#define LOGX_REGISTRY_HPP

#include <logx/channel.hpp>
#include <logx/core.hpp>
#include <logx/error.hpp>
#include <logx/settings.hpp>

namespace logx {

/// Evaluates channel policy against a bound logx::Settings.
///
/// Fails open: the Default channel, an unbound registry, and channels without
/// an entry are all enabled. The settings object is not owned and must
/// outlive the binding.
class ChannelRegistry {
public:
    explicit ChannelRegistry(Environment environment, Settings* settings = nullptr)
        : environment_(environment), settings_(settings) {}

    bool is_enabled(Channel channel) const;

    /// Configured entry for \p channel. NotFound when unbound or unconfigured.
    Result<ChannelConfig> config(Channel channel) const;

    // Mutators forward to the bound settings; NotFound when none is bound.
    Status set_enabled(Channel channel, bool enabled);
    Status set_scope(Channel channel, Scope scope);
    Status set_all_enabled(bool enabled);
    Status reset_to_defaults();

    void bind(Settings* settings) noexcept { settings_ = settings; warned_unbound_ = false; }
    [[nodiscard]] Settings* settings() const noexcept { return settings_; }

    [[nodiscard]] Environment environment() const noexcept { return environment_; }
    void set_environment(Environment environment) noexcept { environment_ = environment; }

private:
    Status require_settings() const;

    Environment  environment_;
    Settings*    settings_{nullptr};
    mutable bool warned_unbound_{false};
};

} // namespace logx

#endif // LOGX_REGISTRY_HPP
