/// \file settings.hpp
/// \brief Channel configuration source and its flat-text persistence.
///
/// Text form, one entry per line, `#` starts a comment:
/// \code
///   rate_limiting = on
///   default_rate_limit = 0.1
///   channel.Audio = Both on
///   channel.Performance = EditorOnly on
/// \endcode

#ifndef LOGX_SETTINGS_HPP
#define LOGX_SETTINGS_HPP

#include <logx/channel.hpp>
#include <logx/error.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace logx {

struct Settings {
    std::vector<ChannelConfig> channels;
    bool   enable_rate_limiting{true};
    double default_rate_limit_seconds{0.1};

    /// Entry for \p channel, or nullptr when the channel is unconfigured.
    const ChannelConfig* find(Channel channel) const;
    ChannelConfig*       find(Channel channel);

    /// Upsert. A new entry starts as {scope=Both, enabled=true}.
    /// Validation error for Channel::Default.
    Status set_channel_enabled(Channel channel, bool enabled);
    Status set_channel_scope(Channel channel, Scope scope);

    /// Enable or disable every non-default channel, adding missing entries.
    void set_all_enabled(bool enabled);

    /// Replace all entries with one per non-default channel, enabled, scope
    /// Both, except kNoisyChannel which is EditorOnly.
    void initialize_defaults();

    static Settings defaults();
};

Result<Settings> parse_settings(std::string_view text);
std::string      format_settings(const Settings& settings);

Result<Settings> load_settings(std::string_view path);
Status           save_settings(const Settings& settings, std::string_view path);

} // namespace logx

#endif // LOGX_SETTINGS_HPP
