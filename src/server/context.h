#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// ServerConfig -- runtime parameters of the caching resolver node.
//
// Built from a core::Config (command line over config file).  ServerConfig
// is the single source of truth for every tunable of the cache, the rate
// limiter and the refresh pool.
// ---------------------------------------------------------------------------

#ifndef PKARR_SERVER_CONTEXT_H
#define PKARR_SERVER_CONTEXT_H

#include "core/config.h"
#include "core/error.h"
#include "core/logging.h"
#include "net/address.h"
#include "server/logging_init.h"
#include "server/rate_limiter.h"
#include "server/refresh_pool.h"

#include <cstdint>
#include <string>
#include <vector>

namespace server {

// ---------------------------------------------------------------------------
// Version constants
// ---------------------------------------------------------------------------

inline constexpr int VERSION_MAJOR = 0;
inline constexpr int VERSION_MINOR = 1;
inline constexpr int VERSION_PATCH = 0;
inline constexpr const char* VERSION_SUFFIX = "";

/// "0.1.0", with "-<suffix>" appended when VERSION_SUFFIX is set.
std::string get_version_string();

/// "Pkarr v0.1.0".
std::string get_client_name();

// ---------------------------------------------------------------------------
// ServerConfig
// ---------------------------------------------------------------------------

struct ServerConfig {
    // -- Cache ---------------------------------------------------------------
    uint32_t minimum_ttl = 30;
    uint32_t maximum_ttl = 24 * 60 * 60;
    size_t   cache_size  = 1'000'000;

    // -- Rate limiting -------------------------------------------------------
    uint32_t rate_limit_requests = 2;
    int64_t  rate_limit_window   = 1;        // seconds
    int64_t  rate_limit_idle     = 60;       // seconds
    size_t   rate_limit_max_ips  = 100'000;

    // -- Refresh -------------------------------------------------------------
    size_t refresh_threads = 4;
    size_t refresh_queue   = 1024;
    std::vector<net::SocketAddress> resolvers;

    // -- Logging -------------------------------------------------------------
    LogSettings logging;

    /// Read every key from @p config.  Missing keys keep their defaults.
    /// Fails with CONFIG_INVALID on values out of range or inconsistent
    /// with each other, and on resolver addresses that do not resolve.
    static core::Result<ServerConfig> from_config(const core::Config& config);

    [[nodiscard]] RateLimiter::Options rate_limiter_options() const;
    [[nodiscard]] RefreshPool::Options refresh_pool_options() const;
};

/// Multi-line summary of @p config logged when a Node starts.
[[nodiscard]] std::string get_startup_banner(const ServerConfig& config);

/// Print version information to stdout.
void print_version();

} // namespace server

#endif // PKARR_SERVER_CONTEXT_H
