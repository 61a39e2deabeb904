// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server/context.h"

#include "core/time.h"

#include <iostream>
#include <limits>
#include <sstream>

namespace server {

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

std::string get_version_string() {
    std::ostringstream ss;
    ss << VERSION_MAJOR << '.' << VERSION_MINOR << '.' << VERSION_PATCH;
    if (VERSION_SUFFIX[0] != '\0') {
        ss << '-' << VERSION_SUFFIX;
    }
    return ss.str();
}

std::string get_client_name() {
    return "Pkarr v" + get_version_string();
}

// ---------------------------------------------------------------------------
// ServerConfig
// ---------------------------------------------------------------------------

namespace {

core::Error invalid(const std::string& key, const std::string& why) {
    return core::make_error(core::ErrorCode::CONFIG_INVALID,
                            "-" + key + ": " + why);
}

/// Integer key constrained to [lo, hi].
core::Result<int64_t> read_ranged(const core::Config& config,
                                  const char* key, int64_t def,
                                  int64_t lo, int64_t hi) {
    int64_t v = config.get_int(key, def);
    if (v < lo || v > hi) {
        return invalid(key, "value " + std::to_string(v) +
                            " outside [" + std::to_string(lo) + ", " +
                            std::to_string(hi) + "]");
    }
    return v;
}

} // anonymous namespace

core::Result<ServerConfig> ServerConfig::from_config(
    const core::Config& config) {
    ServerConfig out;
    constexpr int64_t u32_max = std::numeric_limits<uint32_t>::max();

    PKARR_TRY_ASSIGN(min_ttl, read_ranged(config, core::CONF_MINIMUM_TTL,
                                          out.minimum_ttl, 0, u32_max));
    PKARR_TRY_ASSIGN(max_ttl, read_ranged(config, core::CONF_MAXIMUM_TTL,
                                          out.maximum_ttl, 0, u32_max));
    if (min_ttl > max_ttl) {
        return invalid(core::CONF_MINIMUM_TTL,
                       "minimum TTL " + std::to_string(min_ttl) +
                       " exceeds maximum TTL " + std::to_string(max_ttl));
    }
    out.minimum_ttl = static_cast<uint32_t>(min_ttl);
    out.maximum_ttl = static_cast<uint32_t>(max_ttl);

    PKARR_TRY_ASSIGN(cache_size, read_ranged(
        config, core::CONF_CACHE_SIZE,
        static_cast<int64_t>(out.cache_size), 1, 1'000'000'000));
    out.cache_size = static_cast<size_t>(cache_size);

    PKARR_TRY_ASSIGN(requests, read_ranged(config, core::CONF_RATE_REQUESTS,
                                           out.rate_limit_requests, 0,
                                           u32_max));
    out.rate_limit_requests = static_cast<uint32_t>(requests);

    PKARR_TRY_ASSIGN(window, read_ranged(config, core::CONF_RATE_WINDOW,
                                         out.rate_limit_window, 1, 86400));
    out.rate_limit_window = window;

    PKARR_TRY_ASSIGN(idle, read_ranged(config, core::CONF_RATE_IDLE,
                                       out.rate_limit_idle, 1, 86400));
    if (idle < window) {
        return invalid(core::CONF_RATE_IDLE,
                       "idle period shorter than the rate limit window");
    }
    out.rate_limit_idle = idle;

    PKARR_TRY_ASSIGN(max_ips, read_ranged(
        config, core::CONF_RATE_MAX_IPS,
        static_cast<int64_t>(out.rate_limit_max_ips), 1, 100'000'000));
    out.rate_limit_max_ips = static_cast<size_t>(max_ips);

    PKARR_TRY_ASSIGN(threads, read_ranged(
        config, core::CONF_REFRESH_THREADS,
        static_cast<int64_t>(out.refresh_threads), 1, 256));
    out.refresh_threads = static_cast<size_t>(threads);

    PKARR_TRY_ASSIGN(queue, read_ranged(
        config, core::CONF_REFRESH_QUEUE,
        static_cast<int64_t>(out.refresh_queue), 1, 1'000'000));
    out.refresh_queue = static_cast<size_t>(queue);

    for (const auto& entry : config.get_list(core::CONF_RESOLVER)) {
        auto addrs = net::resolve_socket_addresses(entry);
        if (!addrs.ok()) {
            return invalid(core::CONF_RESOLVER, addrs.error().message());
        }
        out.resolvers.insert(out.resolvers.end(),
                             addrs.value().begin(), addrs.value().end());
    }

    out.logging = LogSettings::from_config(config);

    return out;
}

RateLimiter::Options ServerConfig::rate_limiter_options() const {
    RateLimiter::Options opts;
    opts.max_requests = rate_limit_requests;
    opts.window_ms    = rate_limit_window * 1000;
    opts.idle_ms      = rate_limit_idle * 1000;
    opts.max_tracked  = rate_limit_max_ips;
    return opts;
}

RefreshPool::Options ServerConfig::refresh_pool_options() const {
    RefreshPool::Options opts;
    opts.num_threads    = refresh_threads;
    opts.queue_capacity = refresh_queue;
    if (!resolvers.empty()) {
        opts.resolvers = resolvers;
    }
    return opts;
}

// ---------------------------------------------------------------------------
// Banner / version
// ---------------------------------------------------------------------------

std::string get_startup_banner(const ServerConfig& config) {
    std::ostringstream ss;

    ss << "\n"
       << "============================================================\n"
       << "  " << get_client_name() << "\n"
       << "  Build: " << __DATE__ << " " << __TIME__ << "\n"
       << "  Compiler: "
#if defined(__clang__)
       << "Clang " << __clang_major__ << "." << __clang_minor__
#elif defined(__GNUC__)
       << "GCC " << __GNUC__ << "." << __GNUC_MINOR__
#else
       << "Unknown"
#endif
       << " | C++ " << __cplusplus << "\n"
       << "  TTL bounds: " << config.minimum_ttl << "s - "
       << config.maximum_ttl << "s\n"
       << "  Cache size: " << config.cache_size << " packets\n"
       << "  Rate limit: " << config.rate_limit_requests << " per "
       << config.rate_limit_window << "s per IP\n"
       << "  Refresh: " << config.refresh_threads << " workers, queue "
       << config.refresh_queue << "\n"
       << "  Resolvers: ";
    if (config.resolvers.empty()) {
        ss << "DHT traversal";
    } else {
        for (size_t i = 0; i < config.resolvers.size(); ++i) {
            if (i) ss << ", ";
            ss << config.resolvers[i].to_string();
        }
    }
    ss << "\n"
       << "  Log level: " << core::log_level_string(config.logging.level) << "\n"
       << "  Started: " << core::format_iso8601(core::get_time()) << "\n"
       << "============================================================\n";

    return ss.str();
}

void print_version() {
    std::cout
        << get_client_name() << "\n"
        << "Copyright (c) 2024-2026 The Pkarr Developers\n"
        << "Distributed under the MIT software license.\n";
}

} // namespace server
