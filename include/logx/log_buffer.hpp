/// \file log_buffer.hpp
/// \brief Bounded in-memory record history with filtering and text export.

#ifndef LOGX_LOG_BUFFER_HPP
#define LOGX_LOG_BUFFER_HPP

#include <logx/error.hpp>
#include <logx/sink.hpp>

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace logx {

/// View filter over a LogBuffer. Errors include Fatal records.
struct BufferFilter {
    bool        show_info{true};
    bool        show_warnings{true};
    bool        show_errors{true};
    std::string search;                   ///< Case-insensitive substring; empty matches all.
};

class LogBuffer final : public Sink {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;
    static constexpr std::size_t kMinCapacity     = 100;
    static constexpr std::size_t kMaxCapacity     = 5000;

    /// \p capacity is clamped into [kMinCapacity, kMaxCapacity]; use
    /// set_capacity() to have out-of-range values rejected instead.
    explicit LogBuffer(std::size_t capacity = kDefaultCapacity);

    /// Appends, dropping the oldest record when full.
    void write(const Record& record) override;

    /// Validation error outside [kMinCapacity, kMaxCapacity]. Shrinking drops
    /// the oldest records.
    Status set_capacity(std::size_t capacity);
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }
    [[nodiscard]] const std::deque<Record>& records() const noexcept { return records_; }
    void clear() noexcept { records_.clear(); }

    std::size_t count(Level level) const;
    std::vector<Record> filtered(const BufferFilter& filter) const;

    /// Flat text dump of the records matching \p filter.
    std::string export_text(const BufferFilter& filter = {}) const;
    Status export_to(std::string_view path, const BufferFilter& filter = {}) const;

private:
    void trim_to_capacity();

    std::size_t        capacity_;
    std::deque<Record> records_;
};

} // namespace logx

#endif // LOGX_LOG_BUFFER_HPP
