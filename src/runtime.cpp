/// \file runtime.cpp
/// \brief Implementation of logx::Runtime.

#include <logx/runtime.hpp>

namespace logx {

Runtime::Runtime(Sink& sink, RuntimeOptions options)
    : sink_(&sink),
      clock_(&steady_clock_),
      limiter_(*clock_, options.max_rate_limit_keys),
      channels_(options.environment),
      enabled_(options.enabled) {}

Runtime::Runtime(Sink& sink, const Clock& clock, RuntimeOptions options)
    : sink_(&sink),
      clock_(&clock),
      limiter_(clock, options.max_rate_limit_keys),
      channels_(options.environment),
      enabled_(options.enabled) {}

Status Runtime::request_pause() {
    if (environment() != Environment::Editor)
        return std::unexpected(Error::unsupported("Pausing is only available in the editor"));
    if (!pause_handler_)
        return std::unexpected(Error::not_found("No pause handler installed"));
    pause_handler_();
    return logx::ok();
}

void Runtime::reset() {
    limiter_.clear();
    context_.clear();
}

} // namespace logx
