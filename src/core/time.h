#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace core {

/// Returns current Unix timestamp in seconds since epoch.
int64_t get_time();

/// Returns current time in milliseconds since epoch.
int64_t get_time_millis();

/// Returns current time in microseconds since epoch.
int64_t get_time_micros();

/// Formats a Unix timestamp (seconds) as ISO 8601: "2026-02-03T00:00:00Z".
std::string format_iso8601(int64_t timestamp);

// ---------------------------------------------------------------------------
// Clock -- injectable time source.
// ---------------------------------------------------------------------------
// Components that reason about elapsed time take a Clock at construction so
// tests can drive them deterministically.  The unit (seconds, milliseconds)
// is documented by the component that consumes it.
using Clock = std::function<int64_t()>;

/// Wall-clock seconds (get_time) as a Clock.
Clock system_clock_seconds();

/// Wall-clock milliseconds (get_time_millis) as a Clock.
Clock system_clock_millis();

// ---------------------------------------------------------------------------
// StopWatch - a simple high-resolution timer.
// ---------------------------------------------------------------------------

class StopWatch {
public:
    /// Constructs and immediately starts the stopwatch.
    StopWatch();

    /// Returns elapsed time in milliseconds since construction or last reset.
    int64_t elapsed_ms() const;

    /// Returns elapsed time in microseconds since construction or last reset.
    int64_t elapsed_us() const;

    /// Resets the stopwatch to the current point in time.
    void reset();

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace core
