// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the per-source rate limiter.

#include "test_framework.h"

#include "net/address.h"
#include "server/rate_limiter.h"

#include <cstdint>

namespace {

net::NetAddress ip(const char* text) {
    return net::NetAddress::from_string(text).value();
}

server::RateLimiter::Options opts(uint32_t max_requests, int64_t window_ms,
                                  int64_t idle_ms = 60'000,
                                  size_t max_tracked = 1000) {
    server::RateLimiter::Options o;
    o.max_requests = max_requests;
    o.window_ms    = window_ms;
    o.idle_ms      = idle_ms;
    o.max_tracked  = max_tracked;
    return o;
}

} // namespace

TEST_CASE(RateLimiter, allows_n_then_limits) {
    int64_t now = 0;
    server::RateLimiter limiter(opts(2, 1000), [&] { return now; });
    auto a = ip("10.0.0.1");

    CHECK(!limiter.is_limited(a));
    CHECK(!limiter.is_limited(a));
    CHECK(limiter.is_limited(a));
    CHECK(limiter.is_limited(a));
}

TEST_CASE(RateLimiter, window_slides) {
    int64_t now = 0;
    server::RateLimiter limiter(opts(2, 1000), [&] { return now; });
    auto a = ip("10.0.0.1");

    CHECK(!limiter.is_limited(a));
    now = 500;
    CHECK(!limiter.is_limited(a));
    now = 900;
    CHECK(limiter.is_limited(a));

    // The request at t=0 has left the window, but t=500 and t=900 remain.
    now = 1000;
    CHECK(limiter.is_limited(a));

    // Everything before t=1100 has left the window.
    now = 2500;
    CHECK(!limiter.is_limited(a));
}

TEST_CASE(RateLimiter, sources_are_independent) {
    int64_t now = 0;
    server::RateLimiter limiter(opts(1, 1000), [&] { return now; });
    auto a = ip("10.0.0.1");
    auto b = ip("10.0.0.2");
    auto v6 = ip("2001:db8::1");

    CHECK(!limiter.is_limited(a));
    CHECK(limiter.is_limited(a));
    CHECK(!limiter.is_limited(b));
    CHECK(!limiter.is_limited(v6));
    CHECK(limiter.is_limited(v6));
    CHECK_EQ(limiter.tracked(), size_t{3});
}

TEST_CASE(RateLimiter, zero_allowance_limits_everything) {
    server::RateLimiter limiter(opts(0, 1000), [] { return int64_t{0}; });
    CHECK(limiter.is_limited(ip("10.0.0.1")));
}

TEST_CASE(RateLimiter, sweep_reclaims_idle_sources) {
    int64_t now = 0;
    server::RateLimiter limiter(opts(2, 1000, 5000), [&] { return now; });

    CHECK(!limiter.is_limited(ip("10.0.0.1")));
    now = 3000;
    CHECK(!limiter.is_limited(ip("10.0.0.2")));
    CHECK_EQ(limiter.tracked(), size_t{2});

    CHECK_EQ(limiter.sweep(4000), size_t{0});
    CHECK_EQ(limiter.sweep(6000), size_t{1});
    CHECK_EQ(limiter.tracked(), size_t{1});
    CHECK_EQ(limiter.sweep(9000), size_t{1});
    CHECK_EQ(limiter.tracked(), size_t{0});
}

TEST_CASE(RateLimiter, tracked_sources_are_bounded) {
    int64_t now = 0;
    server::RateLimiter limiter(opts(1, 1000, 60'000, 2), [&] { return now; });
    auto a = ip("10.0.0.1");
    auto b = ip("10.0.0.2");
    auto c = ip("10.0.0.3");

    CHECK(!limiter.is_limited(a));
    CHECK(!limiter.is_limited(b));
    CHECK(!limiter.is_limited(c));
    CHECK_EQ(limiter.tracked(), size_t{2});

    // a was reclaimed, so it starts a fresh window.
    CHECK(!limiter.is_limited(a));
    // c is still tracked and already used its allowance.
    CHECK(limiter.is_limited(c));
}

TEST_CASE(RateLimiter, ipv4_mapped_counts_as_ipv4) {
    server::RateLimiter limiter(opts(1, 1000), [] { return int64_t{0}; });
    CHECK(!limiter.is_limited(ip("192.0.2.7")));
    CHECK(limiter.is_limited(ip("::ffff:c000:207")));
}
