/// \file diagnostics.cpp
/// \brief Implementation of logx's internal diagnostics/logging helpers.

#include <logx/diagnostics.hpp>

#include <atomic>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#elif defined(__APPLE__)
#include <sys/sysctl.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace logx::diagnostics {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Warning};
std::mutex g_io_mutex;
PerformanceCounters g_counters;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error:   return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info:    return "info";
        case LogLevel::Debug:   return "debug";
        case LogLevel::Trace:   return "trace";
    }
    return "unknown";
}

} // namespace

Status set_log_level(LogLevel level) {
    g_level.store(level, std::memory_order_relaxed);
    return logx::ok();
}

LogLevel log_level() {
    return g_level.load(std::memory_order_relaxed);
}

void log(LogLevel level, std::string_view domain, std::string_view message) {
    if (static_cast<int>(level) > static_cast<int>(log_level()))
        return;

    {
        std::lock_guard<std::mutex> lock(g_io_mutex);
        std::cerr << "[logx][" << level_name(level) << "][" << domain << "] "
                  << message << "\n";
    }
    ++g_counters.log_messages;
}

Error enrich(Error base, std::string_view context_suffix) {
    if (!base.context.empty())
        base.context += " | ";
    base.context += std::string(context_suffix);
    return base;
}

Status assert_invariant(bool condition, std::string_view message) {
    if (condition)
        return logx::ok();

    ++g_counters.invariant_failures;
    log(LogLevel::Error, "invariant", message);
    return std::unexpected(Error::internal("Invariant failed", std::string(message)));
}

void note_emitted() {
    ++g_counters.records_emitted;
}

void note_suppressed(Suppression reason) {
    switch (reason) {
        case Suppression::GlobalDisabled:   ++g_counters.suppressed_global; break;
        case Suppression::InstanceDisabled: ++g_counters.suppressed_instance; break;
        case Suppression::Channel:          ++g_counters.suppressed_channel; break;
        case Suppression::RateLimit:        ++g_counters.suppressed_rate_limit; break;
    }
}

void note_assertion_failure() {
    ++g_counters.assertion_failures;
}

void reset_performance_counters() {
    g_counters = {};
}

PerformanceCounters performance_counters() {
    return g_counters;
}

bool debugger_attached() {
#if defined(__linux__)
    // A non-zero TracerPid in /proc/self/status means ptrace is attached.
    std::ifstream status("/proc/self/status");
    std::string line;
    constexpr std::string_view kTracer = "TracerPid:";
    while (std::getline(status, line)) {
        if (line.compare(0, kTracer.size(), kTracer) != 0)
            continue;
        auto pos = line.find_first_not_of(" \t", kTracer.size());
        return pos != std::string::npos && line[pos] != '0';
    }
    return false;
#elif defined(_WIN32)
    return IsDebuggerPresent() != 0;
#elif defined(__APPLE__)
    // P_TRACED is set on the process while a debugger is attached.
    int mib[4] = {CTL_KERN, KERN_PROC, KERN_PROC_PID, static_cast<int>(getpid())};
    struct kinfo_proc info {};
    std::size_t size = sizeof(info);
    if (sysctl(mib, 4, &info, &size, nullptr, 0) != 0)
        return false;
    return (info.kp_proc.p_flag & P_TRACED) != 0;
#else
    return false;
#endif
}

} // namespace logx::diagnostics
