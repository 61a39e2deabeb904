#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// RateLimiter -- per-source sliding-window request limiter.
//
// Gates the DHT lookups the resolver issues on behalf of remote requesters,
// so a single source cannot turn cache misses into an amplification attack.
// Each tracked IP keeps the timestamps of its requests inside the window.
// IPs that have been idle for longer than the idle period are reclaimed by
// sweep(), and the table never holds more than max_tracked addresses.
// ---------------------------------------------------------------------------

#include "core/time.h"
#include "net/address.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <list>
#include <mutex>
#include <unordered_map>

namespace server {

class RateLimiter {
public:
    struct Options {
        /// Requests allowed per window before the source is limited.
        uint32_t max_requests = 2;
        int64_t  window_ms    = 1000;
        /// Sources silent for this long are forgotten.
        int64_t  idle_ms      = 60'000;
        size_t   max_tracked  = 100'000;
    };

    /// sweep() runs automatically once every SWEEP_INTERVAL calls to
    /// is_limited().
    static constexpr uint64_t SWEEP_INTERVAL = 1024;

    /// @param clock  Milliseconds since epoch.
    explicit RateLimiter(Options options,
                         core::Clock clock = core::system_clock_millis());

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Record a request from @p source and report whether it exceeds the
    /// allowance.  A limited request is still recorded.
    [[nodiscard]] bool is_limited(const net::NetAddress& source);

    /// Drop sources idle since before now - idle_ms.  Returns the number
    /// of sources removed.
    size_t sweep(int64_t now);

    /// Number of source addresses currently tracked.
    [[nodiscard]] size_t tracked() const;

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    struct Window {
        std::deque<int64_t>                    requests;
        int64_t                                last_seen = 0;
        std::list<net::NetAddress>::iterator   lru_pos;
    };

    const Options      options_;
    const core::Clock  clock_;

    std::unordered_map<net::NetAddress, Window> windows_;
    /// Most recently active source at the front.
    std::list<net::NetAddress>                  lru_;
    uint64_t                                    calls_ = 0;
    mutable std::mutex                          mutex_;

    size_t sweep_locked(int64_t now);
    void   reclaim_oldest_locked();
};

}  // namespace server
