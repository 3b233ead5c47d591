/// \file sink.cpp
/// \brief Console sink implementation.

#include <logx/sink.hpp>

#include <iostream>

namespace logx {

ConsoleSink::ConsoleSink(std::ostream& out, bool use_color)
    : out_(&out), use_color_(use_color) {}

ConsoleSink::ConsoleSink() : ConsoleSink(std::cerr, true) {}

void ConsoleSink::write(const Record& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& os = *out_;
    os << '[' << level_name(record.level) << "] ";
    if (use_color_) {
        os << "\x1b[38;2;" << int(record.color.r) << ';' << int(record.color.g) << ';'
           << int(record.color.b) << 'm' << record.message << "\x1b[0m";
    } else {
        os << record.message;
    }
    os << '\n';
    if (record.level >= Level::Error)
        os.flush();
}

} // namespace logx
