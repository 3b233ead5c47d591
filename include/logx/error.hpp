/// \file error.hpp
/// \brief Core error and result types for logx.
///
/// Provides logx::Error, logx::Result<T>, and logx::Status as the canonical
/// error model used by every fallible logx operation. Emission paths never
/// report errors; configuration, scope and export paths do.

#ifndef LOGX_ERROR_HPP
#define LOGX_ERROR_HPP

#include <expected>
#include <string>
#include <utility>

namespace logx {

// ── Error category ──────────────────────────────────────────────────────

/// Broad classification of an error's origin.
enum class ErrorCategory {
    Validation,   ///< Caller-supplied argument was invalid.
    NotFound,     ///< The requested object does not exist.
    Conflict,     ///< Operation conflicts with existing state.
    Unsupported,  ///< The operation is not supported in the current context.
    IoFailure,    ///< Reading or writing a file failed.
    Internal,     ///< Bug inside logx itself.
};

// ── Error ───────────────────────────────────────────────────────────────

/// Structured error value carried through every Result / Status.
struct Error {
    ErrorCategory category{ErrorCategory::Internal};
    int           code{0};
    std::string   message;
    std::string   context;

    /// Convenience constructors.
    static Error validation(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Validation, 0, std::move(msg), std::move(ctx)};
    }
    static Error not_found(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::NotFound, 0, std::move(msg), std::move(ctx)};
    }
    static Error conflict(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Conflict, 0, std::move(msg), std::move(ctx)};
    }
    static Error unsupported(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Unsupported, 0, std::move(msg), std::move(ctx)};
    }
    static Error io(std::string msg, std::string ctx = {}, int err = 0) {
        return {ErrorCategory::IoFailure, err, std::move(msg), std::move(ctx)};
    }
    static Error internal(std::string msg, std::string ctx = {}) {
        return {ErrorCategory::Internal, 0, std::move(msg), std::move(ctx)};
    }
};

// ── Result / Status aliases ─────────────────────────────────────────────

/// A value-or-error return type.
template <typename T>
using Result = std::expected<T, Error>;

/// A void-or-error return type (for operations that succeed or fail).
using Status = std::expected<void, Error>;

/// Helper: return a successful void Status.
inline Status ok() { return {}; }

} // namespace logx

#endif // LOGX_ERROR_HPP
