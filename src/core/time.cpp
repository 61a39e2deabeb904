#include "time.h"

#include <array>
#include <ctime>

namespace core {

// ---------------------------------------------------------------------------
// Free functions - wall-clock time
// ---------------------------------------------------------------------------

int64_t get_time()
{
    using namespace std::chrono;
    return duration_cast<seconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

int64_t get_time_millis()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

int64_t get_time_micros()
{
    using namespace std::chrono;
    return duration_cast<microseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

std::string format_iso8601(int64_t timestamp)
{
    std::time_t tt = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    // "YYYY-MM-DDTHH:MM:SSZ" is exactly 20 characters + null.
    std::array<char, 32> buf{};
    std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf.data());
}

// ---------------------------------------------------------------------------
// Clock factories
// ---------------------------------------------------------------------------

Clock system_clock_seconds()
{
    return [] { return get_time(); };
}

Clock system_clock_millis()
{
    return [] { return get_time_millis(); };
}

// ---------------------------------------------------------------------------
// StopWatch
// ---------------------------------------------------------------------------

StopWatch::StopWatch()
    : start_(std::chrono::steady_clock::now())
{
}

int64_t StopWatch::elapsed_ms() const
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - start_).count();
}

int64_t StopWatch::elapsed_us() const
{
    using namespace std::chrono;
    return duration_cast<microseconds>(steady_clock::now() - start_).count();
}

void StopWatch::reset()
{
    start_ = std::chrono::steady_clock::now();
}

} // namespace core
