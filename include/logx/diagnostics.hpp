/// \file diagnostics.hpp
/// \brief Internal diagnostics, self-logging, and lightweight counters.
///
/// This is logx talking about itself (configuration warnings, misuse,
/// evictions). Records produced by logx::Logger go to a logx::Sink instead.

#ifndef LOGX_DIAGNOSTICS_HPP
#define LOGX_DIAGNOSTICS_HPP

#include <logx/error.hpp>

#include <cstdint>
#include <string_view>

namespace logx::diagnostics {

enum class LogLevel {
    Error = 0,
    Warning,
    Info,
    Debug,
    Trace,
};

/// Gate that stopped a record from reaching its sink.
enum class Suppression {
    GlobalDisabled,
    InstanceDisabled,
    Channel,
    RateLimit,
};

struct PerformanceCounters {
    std::uint64_t log_messages{0};
    std::uint64_t invariant_failures{0};
    std::uint64_t records_emitted{0};
    std::uint64_t suppressed_global{0};
    std::uint64_t suppressed_instance{0};
    std::uint64_t suppressed_channel{0};
    std::uint64_t suppressed_rate_limit{0};
    std::uint64_t assertion_failures{0};
};

Status set_log_level(LogLevel level);
LogLevel log_level();

void log(LogLevel level, std::string_view domain, std::string_view message);

/// Enrich an existing error with additional context text.
Error enrich(Error base, std::string_view context_suffix);

/// Assertion-like invariant helper for non-obvious runtime expectations.
Status assert_invariant(bool condition, std::string_view message);

void note_emitted();
void note_suppressed(Suppression reason);
void note_assertion_failure();

void reset_performance_counters();
PerformanceCounters performance_counters();

/// True when a debugger or tracer is attached to this process.
bool debugger_attached();

} // namespace logx::diagnostics

#endif // LOGX_DIAGNOSTICS_HPP
