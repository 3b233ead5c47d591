/// \file core.cpp
/// \brief Shared value type helpers.

#include <logx/core.hpp>

namespace logx {

const char* level_name(Level level) {
    switch (level) {
        case Level::Info:    return "Info";
        case Level::Warning: return "Warning";
        case Level::Error:   return "Error";
        case Level::Fatal:   return "Fatal";
    }
    return "Unknown";
}

} // namespace logx
