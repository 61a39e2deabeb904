#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PKARR_CORE_LOGGING_H
#define PKARR_CORE_LOGGING_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// LogLevel: severity levels for log messages
// ---------------------------------------------------------------------------
enum class LogLevel : int {
    TRACE   = 0,
    DEBUG   = 1,
    INFO    = 2,
    WARN    = 3,
    ERR     = 4,  // "ERROR" conflicts with Windows <windows.h> macro
    FATAL   = 5,
    OFF     = 6,
};

// ---------------------------------------------------------------------------
// LogCategory: bitmask categories for filtering log output
// ---------------------------------------------------------------------------
enum class LogCategory : uint32_t {
    NONE       = 0,
    DHT        = 1u << 0,
    CACHE      = 1u << 1,
    RESOLVER   = 1u << 2,
    RATELIMIT  = 1u << 3,
    CRYPTO     = 1u << 4,
    DNS        = 1u << 5,
    CLIENT     = 1u << 6,
    CONFIG     = 1u << 7,
    ALL        = 0xFFFFFFFF,
};

inline constexpr LogCategory operator|(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline constexpr LogCategory operator&(LogCategory a, LogCategory b) noexcept {
    return static_cast<LogCategory>(
        static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------

/// Returns the short string name for a log level (e.g. "INFO", "WARN").
[[nodiscard]] std::string_view log_level_string(LogLevel level) noexcept;

/// Parses a level name ("trace", "debug", "info", "warn", "error",
/// "fatal", "off"; case-insensitive).  Unknown names yield @p fallback.
[[nodiscard]] LogLevel parse_log_level(std::string_view name,
                                       LogLevel fallback) noexcept;

/// Returns the short string name for a single log category bit.
/// If multiple bits are set, returns the name of the lowest set bit.
[[nodiscard]] std::string_view log_category_string(
    LogCategory cat) noexcept;

/// Parses a comma-separated list of category names into a bitmask.
/// An empty list or a list with no known names yields ALL.
[[nodiscard]] uint32_t parse_log_categories(std::string_view list);

// ---------------------------------------------------------------------------
// Logger: thread-safe singleton logger
// ---------------------------------------------------------------------------
class Logger {
public:
    /// Returns the process-wide singleton instance.
    static Logger& instance();

    /// Sets the minimum severity level. Messages below this are discarded.
    void set_level(LogLevel level);

    /// Replaces the enabled category bitmask.
    void set_categories(uint32_t mask);

    void enable_category(LogCategory cat);
    void disable_category(LogCategory cat);

    [[nodiscard]] LogLevel level() const noexcept;

    /// Fast lockless check: returns true if a message at the given
    /// level and category would actually be written.
    [[nodiscard]] bool will_log(LogLevel level,
                                LogCategory cat) const noexcept;

    void set_print_to_console(bool enable);
    void set_print_to_file(bool enable);

    /// Opens (or replaces) the output log file in append mode. An empty
    /// path closes the current file.  Returns false when the file cannot
    /// be opened; file logging is then disabled.
    bool set_log_file(const std::filesystem::path& path);

    /// Flushes all buffered output to console and file sinks.
    void flush();

    /// Writes a fully formatted log line. The caller is responsible for
    /// performing the will_log() check beforehand.
    void write(LogLevel level, LogCategory cat,
               std::string_view message);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&)                 = delete;
    Logger& operator=(Logger&&)      = delete;

private:
    Logger();
    ~Logger();

    /// "2026-02-03 12:00:00.123"
    static std::string format_timestamp();

    /// Must be called with write_mutex_ held.
    void write_line_locked(std::string_view line);
    void flush_file_locked();

    std::atomic<int>      level_{static_cast<int>(LogLevel::INFO)};
    std::atomic<uint32_t> enabled_categories_{
        static_cast<uint32_t>(LogCategory::ALL)};
    std::atomic<bool>     print_to_console_{true};
    std::atomic<bool>     print_to_file_{false};

    mutable std::mutex    write_mutex_;
    std::ofstream         file_stream_;
    std::string           buffer_;

    static constexpr std::size_t BUFFER_FLUSH_THRESHOLD = 8192;
};

} // namespace core

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------
// Each macro performs a lockless will_log() check before doing any string
// formatting, so disabled paths have near-zero overhead.
//
//   LOG_DEBUG(core::LogCategory::CACHE, "stored " + target.to_hex());
// ---------------------------------------------------------------------------

#define PKARR_LOG_AT(lvl, cat, msg)                                       \
    do {                                                                  \
        if (core::Logger::instance().will_log((lvl), (cat))) {            \
            core::Logger::instance().write((lvl), (cat),                  \
                                           std::string(msg));             \
        }                                                                 \
    } while (0)

#define LOG_TRACE(cat, msg) PKARR_LOG_AT(core::LogLevel::TRACE, cat, msg)
#define LOG_DEBUG(cat, msg) PKARR_LOG_AT(core::LogLevel::DEBUG, cat, msg)
#define LOG_INFO(cat, msg)  PKARR_LOG_AT(core::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg)  PKARR_LOG_AT(core::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) PKARR_LOG_AT(core::LogLevel::ERR, cat, msg)
#define LOG_FATAL(cat, msg) PKARR_LOG_AT(core::LogLevel::FATAL, cat, msg)

#endif // PKARR_CORE_LOGGING_H
