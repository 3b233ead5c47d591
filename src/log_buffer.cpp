/// \file log_buffer.cpp
/// \brief Implementation of logx::LogBuffer.

#include <logx/log_buffer.hpp>

#include "detail/text.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <format>
#include <fstream>

namespace logx {

namespace {

bool level_visible(Level level, const BufferFilter& filter) {
    switch (level) {
        case Level::Info:    return filter.show_info;
        case Level::Warning: return filter.show_warnings;
        case Level::Error:
        case Level::Fatal:   return filter.show_errors;
    }
    return true;
}

/// hh:mm:ss.fff from clock seconds.
std::string format_timestamp(double seconds) {
    auto total_ms = static_cast<long long>(std::llround(std::max(seconds, 0.0) * 1000.0));
    return std::format("{:02}:{:02}:{:02}.{:03}",
                       total_ms / 3'600'000, (total_ms / 60'000) % 60,
                       (total_ms / 1000) % 60, total_ms % 1000);
}

const std::string kHeavyRule(80, '=');
const std::string kLightRule(80, '-');

} // namespace

LogBuffer::LogBuffer(std::size_t capacity)
    : capacity_(std::clamp(capacity, kMinCapacity, kMaxCapacity)) {}

void LogBuffer::write(const Record& record) {
    records_.push_back(record);
    trim_to_capacity();
}

Status LogBuffer::set_capacity(std::size_t capacity) {
    if (capacity < kMinCapacity || capacity > kMaxCapacity) {
        return std::unexpected(Error::validation(
            std::format("Capacity must be between {} and {}", kMinCapacity, kMaxCapacity),
            std::to_string(capacity)));
    }
    capacity_ = capacity;
    trim_to_capacity();
    return logx::ok();
}

std::size_t LogBuffer::count(Level level) const {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [level](const Record& r) { return r.level == level; }));
}

std::vector<Record> LogBuffer::filtered(const BufferFilter& filter) const {
    std::vector<Record> out;
    for (const auto& r : records_) {
        if (!level_visible(r.level, filter))
            continue;
        if (!detail::icontains(r.message, filter.search))
            continue;
        out.push_back(r);
    }
    return out;
}

std::string LogBuffer::export_text(const BufferFilter& filter) const {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());

    std::string out;
    out += "logx log export\n";
    out += std::format("Exported: {:%Y-%m-%d %H:%M:%S}\n", now);
    out += std::format("Total logs: {}\n", records_.size());
    out += kHeavyRule + "\n\n";

    for (const auto& r : filtered(filter)) {
        out += std::format("[{}] [{}] {}\n", format_timestamp(r.timestamp),
                           level_name(r.level), r.message);
        out += kLightRule + "\n";
    }
    return out;
}

Status LogBuffer::export_to(std::string_view path, const BufferFilter& filter) const {
    std::ofstream out{std::string(path), std::ios::trunc};
    if (!out)
        return std::unexpected(Error::io("Cannot open export file", std::string(path), errno));
    out << export_text(filter);
    out.flush();
    if (!out)
        return std::unexpected(Error::io("Failed writing export file", std::string(path)));
    return logx::ok();
}

void LogBuffer::trim_to_capacity() {
    while (records_.size() > capacity_)
        records_.pop_front();
}

} // namespace logx
