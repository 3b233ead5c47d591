/// \file test_harness.hpp
/// \brief Shared test utilities for all logx C++ tests.
///
/// Consolidates the CHECK/CHECK_OK/CHECK_ERR macros, test counters, a
/// record-capturing sink, and temp-file helpers used by unit and
/// integration tests.

#ifndef LOGX_TEST_HARNESS_HPP
#define LOGX_TEST_HARNESS_HPP

#include <logx/sink.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace logx_test {

// ── Global test counters ────────────────────────────────────────────────

inline int g_pass = 0;
inline int g_fail = 0;

// ── Section tracking ────────────────────────────────────────────────────

inline std::string g_current_section;

inline void begin_section(const char* name) {
    g_current_section = name;
    std::cout << "\n=== " << name << " ===\n";
}

// ── Core check function ─────────────────────────────────────────────────

inline void check(bool ok, const char* expr, const char* file, int line) {
    if (ok) {
        ++g_pass;
    } else {
        ++g_fail;
        std::cerr << "[FAIL] " << file << ":" << line << ": " << expr
                  << " (in " << g_current_section << ")\n";
    }
}

// ── Report ──────────────────────────────────────────────────────────────

inline int report(const char* test_name) {
    std::cout << "\n" << test_name << ": "
              << g_pass << " passed, "
              << g_fail << " failed\n";
    return g_fail > 0 ? 1 : 0;
}

// ── Capture sink ────────────────────────────────────────────────────────

/// Sink that keeps every record it receives, in order.
struct Capture final : logx::Sink {
    std::vector<logx::Record> records;

    void write(const logx::Record& record) override { records.push_back(record); }

    std::size_t count() const { return records.size(); }
    std::string last() const { return records.empty() ? std::string() : records.back().message; }
    void clear() { records.clear(); }
};

// ── Temp files ──────────────────────────────────────────────────────────

/// Per-process path under the system temp directory. Removed on destruction.
struct TempPath {
    std::filesystem::path path;

    explicit TempPath(std::string_view name)
        : path(std::filesystem::temp_directory_path()
               / (std::string("logx_") + std::string(name))) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    ~TempPath() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::string str() const { return path.string(); }
};

} // namespace logx_test

// ── Macros ──────────────────────────────────────────────────────────────

/// Basic boolean check.
#define CHECK(expr) \
    logx_test::check(static_cast<bool>(expr), #expr, __FILE__, __LINE__)

/// Check that a std::expected (Result/Status) has a value.
#define CHECK_OK(expr) \
    do { \
        auto&& _r = (expr); \
        if (_r.has_value()) { \
            ++logx_test::g_pass; \
        } else { \
            ++logx_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " -> error: " \
                      << _r.error().message << " [" << _r.error().context << "]\n"; \
        } \
    } while (0)

/// Check that a std::expected has an error of a specific category.
#define CHECK_ERR(expr, cat) \
    do { \
        auto&& _r = (expr); \
        if (!_r.has_value() && _r.error().category == (cat)) { \
            ++logx_test::g_pass; \
        } else if (_r.has_value()) { \
            ++logx_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " expected error " << #cat << " but got success\n"; \
        } else { \
            ++logx_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #expr << " expected error " << #cat \
                      << " but got different error: " << _r.error().message << "\n"; \
        } \
    } while (0)

/// Check equality of two values.
#define CHECK_EQ(a, b) \
    do { \
        auto&& _a = (a); \
        auto&& _b = (b); \
        if (_a == _b) { \
            ++logx_test::g_pass; \
        } else { \
            ++logx_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": " << #a << " == " << #b << "\n"; \
        } \
    } while (0)

/// Check that a string contains a substring.
#define CHECK_CONTAINS(haystack, needle) \
    do { \
        std::string _h(haystack); \
        std::string _n(needle); \
        if (_h.find(_n) != std::string::npos) { \
            ++logx_test::g_pass; \
        } else { \
            ++logx_test::g_fail; \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ \
                      << ": \"" << _h << "\" does not contain \"" << _n << "\"\n"; \
        } \
    } while (0)

/// Begin a named test section.
#define SECTION(name) \
    logx_test::begin_section(name)

#endif // LOGX_TEST_HARNESS_HPP
