/// \file settings.cpp
/// \brief Implementation of logx::Settings and its text persistence.

#include <logx/settings.hpp>
#include <logx/diagnostics.hpp>

#include "detail/text.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace logx {

namespace {

constexpr std::string_view kChannelKeyPrefix = "channel.";

Status reject_default(Channel channel) {
    if (channel == Channel::Default)
        return std::unexpected(Error::validation("Default channel cannot be configured"));
    return logx::ok();
}

Error at_line(Error e, std::size_t line_no) {
    return diagnostics::enrich(std::move(e), "line " + std::to_string(line_no));
}

Result<bool> parse_switch(std::string_view text) {
    if (detail::iequals(text, "on") || detail::iequals(text, "true") || text == "1")
        return true;
    if (detail::iequals(text, "off") || detail::iequals(text, "false") || text == "0")
        return false;
    return std::unexpected(Error::validation("Expected on/off", std::string(text)));
}

Result<double> parse_seconds(std::string_view text) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value))
        return std::unexpected(Error::validation("Expected a number of seconds", std::string(text)));
    if (value < 0.0)
        return std::unexpected(Error::validation("Rate limit must not be negative", std::string(text)));
    return value;
}

Result<ChannelConfig> parse_channel_entry(std::string_view name, std::string_view value) {
    auto channel = parse_channel(name);
    if (!channel)
        return std::unexpected(channel.error());
    if (auto st = reject_default(*channel); !st)
        return std::unexpected(st.error());

    auto split = value.find_first_of(" \t");
    if (split == std::string_view::npos)
        return std::unexpected(Error::validation("Expected '<Scope> on|off'", std::string(value)));

    auto scope = parse_scope(detail::trim(value.substr(0, split)));
    if (!scope)
        return std::unexpected(Error::validation(scope.error().message, scope.error().context));
    auto enabled = parse_switch(detail::trim(value.substr(split)));
    if (!enabled)
        return std::unexpected(enabled.error());

    return ChannelConfig{*channel, *scope, *enabled};
}

} // namespace

// ── Settings ────────────────────────────────────────────────────────────

const ChannelConfig* Settings::find(Channel channel) const {
    for (const auto& c : channels)
        if (c.channel == channel)
            return &c;
    return nullptr;
}

ChannelConfig* Settings::find(Channel channel) {
    for (auto& c : channels)
        if (c.channel == channel)
            return &c;
    return nullptr;
}

Status Settings::set_channel_enabled(Channel channel, bool enabled) {
    if (auto st = reject_default(channel); !st)
        return st;
    if (auto* c = find(channel))
        c->enabled = enabled;
    else
        channels.push_back({channel, Scope::Both, enabled});
    return logx::ok();
}

Status Settings::set_channel_scope(Channel channel, Scope scope) {
    if (auto st = reject_default(channel); !st)
        return st;
    if (auto* c = find(channel))
        c->scope = scope;
    else
        channels.push_back({channel, scope, true});
    return logx::ok();
}

void Settings::set_all_enabled(bool enabled) {
    for (Channel c : kAllChannels) {
        if (c == Channel::Default)
            continue;
        if (auto* entry = find(c))
            entry->enabled = enabled;
        else
            channels.push_back({c, Scope::Both, enabled});
    }
}

void Settings::initialize_defaults() {
    channels.clear();
    for (Channel c : kAllChannels) {
        if (c == Channel::Default)
            continue;
        channels.push_back({c, c == kNoisyChannel ? Scope::EditorOnly : Scope::Both, true});
    }
}

Settings Settings::defaults() {
    Settings s;
    s.initialize_defaults();
    return s;
}

// ── Text form ───────────────────────────────────────────────────────────

Result<Settings> parse_settings(std::string_view text) {
    Settings out;
    std::size_t line_no = 0;

    while (!text.empty()) {
        ++line_no;
        auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);

        if (auto hash = line.find('#'); hash != std::string_view::npos)
            line = line.substr(0, hash);
        line = detail::trim(line);
        if (line.empty())
            continue;

        auto eq = line.find('=');
        if (eq == std::string_view::npos)
            return std::unexpected(at_line(Error::validation("Expected 'key = value'",
                                                             std::string(line)), line_no));
        auto key   = detail::trim(line.substr(0, eq));
        auto value = detail::trim(line.substr(eq + 1));

        if (key == "rate_limiting") {
            auto v = parse_switch(value);
            if (!v)
                return std::unexpected(at_line(v.error(), line_no));
            out.enable_rate_limiting = *v;
        } else if (key == "default_rate_limit") {
            auto v = parse_seconds(value);
            if (!v)
                return std::unexpected(at_line(v.error(), line_no));
            out.default_rate_limit_seconds = *v;
        } else if (key.starts_with(kChannelKeyPrefix)) {
            auto entry = parse_channel_entry(key.substr(kChannelKeyPrefix.size()), value);
            if (!entry) {
                auto e = entry.error();
                e.category = ErrorCategory::Validation;
                return std::unexpected(at_line(std::move(e), line_no));
            }
            if (auto* existing = out.find(entry->channel))
                *existing = *entry;
            else
                out.channels.push_back(*entry);
        } else {
            return std::unexpected(at_line(Error::validation("Unknown settings key",
                                                             std::string(key)), line_no));
        }
    }
    return out;
}

std::string format_settings(const Settings& settings) {
    std::ostringstream os;
    os << "# logx settings\n";
    os << "rate_limiting = " << (settings.enable_rate_limiting ? "on" : "off") << "\n";
    os << "default_rate_limit = " << detail::format_number(settings.default_rate_limit_seconds) << "\n";
    for (const auto& c : settings.channels) {
        os << kChannelKeyPrefix << channel_name(c.channel) << " = "
           << scope_name(c.scope) << ' ' << (c.enabled ? "on" : "off") << "\n";
    }
    return os.str();
}

Result<Settings> load_settings(std::string_view path) {
    std::ifstream in{std::string(path)};
    if (!in)
        return std::unexpected(Error::io("Cannot open settings file", std::string(path), errno));

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
        return std::unexpected(Error::io("Failed reading settings file", std::string(path)));

    auto parsed = parse_settings(buffer.str());
    if (!parsed)
        return std::unexpected(diagnostics::enrich(parsed.error(), path));
    return parsed;
}

Status save_settings(const Settings& settings, std::string_view path) {
    std::ofstream out{std::string(path), std::ios::trunc};
    if (!out)
        return std::unexpected(Error::io("Cannot open settings file for writing",
                                         std::string(path), errno));
    out << format_settings(settings);
    out.flush();
    if (!out)
        return std::unexpected(Error::io("Failed writing settings file", std::string(path)));
    return logx::ok();
}

} // namespace logx
