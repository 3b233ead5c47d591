/// \file logx.hpp
/// \brief Master include for logx, the channel-filtered, throttled logger.
///
/// Including this single header brings in every logx namespace.
/// For finer-grained control, include the individual domain headers instead.

#ifndef LOGX_LOGX_HPP
#define LOGX_LOGX_HPP

#include <logx/error.hpp>
#include <logx/core.hpp>
#include <logx/diagnostics.hpp>
#include <logx/clock.hpp>
#include <logx/rate_limiter.hpp>
#include <logx/context.hpp>
#include <logx/channel.hpp>
#include <logx/settings.hpp>
#include <logx/registry.hpp>
#include <logx/sink.hpp>
#include <logx/log_buffer.hpp>
#include <logx/runtime.hpp>
#include <logx/assertion.hpp>
#include <logx/logger.hpp>

#endif // LOGX_LOGX_HPP
