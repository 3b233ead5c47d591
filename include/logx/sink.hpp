/// \file sink.hpp
/// \brief Output endpoints that receive fully formatted records.

#ifndef LOGX_SINK_HPP
#define LOGX_SINK_HPP

#include <logx/channel.hpp>
#include <logx/core.hpp>

#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>
#include <utility>

namespace logx {

/// One emitted message as handed to a sink.
struct Record {
    std::string message;                  ///< Prefix and context already applied.
    Level       level{Level::Info};
    Color       color{};
    Channel     channel{Channel::Default};
    double      timestamp{0.0};           ///< Runtime clock seconds.
    const void* target{nullptr};          ///< Opaque host object, may be null.
};

/// Receives records that passed every gate. Implementations must not throw.
class Sink {
public:
    virtual ~Sink() = default;
    virtual void write(const Record& record) = 0;
};

/// Writes "[Level] message" lines, optionally tinted with 24-bit ANSI color.
class ConsoleSink final : public Sink {
public:
    explicit ConsoleSink(std::ostream& out, bool use_color = true);
    ConsoleSink();

    void write(const Record& record) override;

private:
    std::ostream* out_;
    bool          use_color_;
    std::mutex    mutex_;
};

/// Forwards records to a callable.
class CallbackSink final : public Sink {
public:
    explicit CallbackSink(std::function<void(const Record&)> callback)
        : callback_(std::move(callback)) {}

    void write(const Record& record) override {
        if (callback_)
            callback_(record);
    }

private:
    std::function<void(const Record&)> callback_;
};

} // namespace logx

#endif // LOGX_SINK_HPP
