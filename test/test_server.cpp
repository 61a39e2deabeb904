// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test_framework.h"
#include "dht_fakes.h"

#include "core/config.h"
#include "core/logging.h"
#include "crypto/ed25519.h"
#include "pkarr/bep44.h"
#include "pkarr/cache.h"
#include "server/context.h"
#include "server/logging_init.h"
#include "server/node.h"
#include "server/rate_limiter.h"
#include "server/refresh_pool.h"
#include "server/resolver.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

core::Config config_from(std::vector<const char*> args) {
    args.insert(args.begin(), "pkarr-cli");
    core::Config config;
    config.parse_args(static_cast<int>(args.size()), args.data());
    return config;
}

std::filesystem::path temp_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("pkarr_test_" + name);
}

} // namespace

// ============================================================================
// ServerConfig
// ============================================================================

TEST_CASE(ServerConfig, defaults) {
    auto r = server::ServerConfig::from_config(core::Config{});
    CHECK_OK(r);
    if (!r.ok()) return;
    const auto& c = r.value();
    CHECK_EQ(c.minimum_ttl, uint32_t{30});
    CHECK_EQ(c.maximum_ttl, uint32_t{86400});
    CHECK_EQ(c.cache_size, size_t{1'000'000});
    CHECK_EQ(c.rate_limit_requests, uint32_t{2});
    CHECK(c.resolvers.empty());
    CHECK(c.logging.level == core::LogLevel::INFO);
    CHECK(c.logging.file.empty());

    auto rl = c.rate_limiter_options();
    CHECK_EQ(rl.window_ms, int64_t{1000});
    CHECK_EQ(rl.idle_ms, int64_t{60000});
    CHECK_EQ(rl.max_requests, uint32_t{2});

    auto rp = c.refresh_pool_options();
    CHECK_EQ(rp.num_threads, size_t{4});
    CHECK(!rp.resolvers.has_value());
}

TEST_CASE(ServerConfig, reads_overrides) {
    auto config = config_from({"-minimumttl=60", "-maximumttl=600",
                               "-cachesize=50", "-ratelimitrequests=5",
                               "-ratelimitwindow=2", "-ratelimitidle=10",
                               "-refreshthreads=8", "-loglevel=warn"});
    auto r = server::ServerConfig::from_config(config);
    CHECK_OK(r);
    if (!r.ok()) return;
    const auto& c = r.value();
    CHECK_EQ(c.minimum_ttl, uint32_t{60});
    CHECK_EQ(c.maximum_ttl, uint32_t{600});
    CHECK_EQ(c.cache_size, size_t{50});
    CHECK(c.logging.level == core::LogLevel::WARN);

    auto rl = c.rate_limiter_options();
    CHECK_EQ(rl.max_requests, uint32_t{5});
    CHECK_EQ(rl.window_ms, int64_t{2000});
    CHECK_EQ(rl.idle_ms, int64_t{10000});
    CHECK_EQ(c.refresh_pool_options().num_threads, size_t{8});
}

TEST_CASE(ServerConfig, rejects_inverted_ttls) {
    auto config = config_from({"-minimumttl=100", "-maximumttl=50"});
    CHECK_ERR_CODE(server::ServerConfig::from_config(config),
                   core::ErrorCode::CONFIG_INVALID);
}

TEST_CASE(ServerConfig, rejects_out_of_range) {
    CHECK_ERR_CODE(server::ServerConfig::from_config(
                       config_from({"-cachesize=0"})),
                   core::ErrorCode::CONFIG_INVALID);
    CHECK_ERR_CODE(server::ServerConfig::from_config(
                       config_from({"-minimumttl=-1"})),
                   core::ErrorCode::CONFIG_INVALID);
    CHECK_ERR_CODE(server::ServerConfig::from_config(
                       config_from({"-ratelimitwindow=30",
                                    "-ratelimitidle=10"})),
                   core::ErrorCode::CONFIG_INVALID);
}

TEST_CASE(ServerConfig, resolver_literals) {
    auto config = config_from({"-resolver=127.0.0.1:6881",
                               "-resolver=[::1]:6882"});
    auto r = server::ServerConfig::from_config(config);
    CHECK_OK(r);
    if (!r.ok()) return;
    CHECK_EQ(r.value().resolvers.size(), size_t{2});
    CHECK_EQ(r.value().resolvers[0].to_string(), std::string("127.0.0.1:6881"));
    CHECK_EQ(r.value().resolvers[1].port, uint16_t{6882});

    auto rp = r.value().refresh_pool_options();
    CHECK(rp.resolvers.has_value());
    if (rp.resolvers) CHECK_EQ(rp.resolvers->size(), size_t{2});
}

TEST_CASE(ServerConfig, rejects_bad_resolver) {
    CHECK_ERR_CODE(server::ServerConfig::from_config(
                       config_from({"-resolver=127.0.0.1"})),
                   core::ErrorCode::CONFIG_INVALID);
}

TEST_CASE(ServerConfig, bare_debug_enables_everything) {
    auto r = server::ServerConfig::from_config(
        config_from({"-loglevel=error", "-debug"}));
    CHECK_OK(r);
    if (!r.ok()) return;
    CHECK(r.value().logging.level == core::LogLevel::DEBUG);
    CHECK_EQ(r.value().logging.categories,
             static_cast<uint32_t>(core::LogCategory::ALL));

    auto narrowed = server::ServerConfig::from_config(
        config_from({"-debug=cache,dht"}));
    CHECK_OK(narrowed);
    if (!narrowed.ok()) return;
    CHECK_EQ(narrowed.value().logging.categories,
             static_cast<uint32_t>(core::LogCategory::CACHE) |
             static_cast<uint32_t>(core::LogCategory::DHT));
}

TEST_CASE(ServerConfig, version_string) {
    CHECK_EQ(server::get_version_string(), std::string("0.1.0"));
    CHECK_EQ(server::get_client_name(), std::string("Pkarr v0.1.0"));
}

TEST_CASE(LogSettings, reads_only_logging_keys) {
    // Resolver tunables, valid or not, play no part in logging setup.
    auto config = config_from({"-loglevel=warn", "-cachesize=0",
                               "-resolver=not-an-address",
                               "-logfile=/tmp/pkarr.log",
                               "-printtoconsole=0"});
    auto settings = server::LogSettings::from_config(config);
    CHECK(settings.level == core::LogLevel::WARN);
    CHECK_EQ(settings.file.string(), std::string("/tmp/pkarr.log"));
    CHECK(!settings.print_to_console);
    CHECK_EQ(settings.categories, static_cast<uint32_t>(core::LogCategory::ALL));

    CHECK_ERR_CODE(server::ServerConfig::from_config(config),
                   core::ErrorCode::CONFIG_INVALID);
}

// ============================================================================
// Node
// ============================================================================

namespace {

dht::Request cold_get(const crypto::Keypair& kp) {
    dht::Request r;
    r.kind = dht::GetValueRequest{pkarr::target_for(kp.public_key()),
                                  std::nullopt, std::nullopt};
    return r;
}

} // namespace

TEST_CASE(Node, applies_server_config) {
    server::ServerConfig config;
    config.cache_size          = 3;
    config.rate_limit_requests = 1;
    config.refresh_threads     = 1;
    config.minimum_ttl         = 60;
    config.resolvers.push_back(
        net::SocketAddress::from_string("192.0.2.9:6881").value());

    test::FakeRpc rpc;
    test::FakeFallback fallback;
    server::Node node(config, rpc, fallback);
    CHECK(!node.is_running());
    CHECK(node.handler() == nullptr);

    CHECK_OK(node.init());
    CHECK(node.is_running());
    CHECK(node.handler() != nullptr);
    CHECK(node.client() != nullptr);
    if (!node.is_running()) return;
    CHECK_EQ(node.cache()->capacity(), size_t{3});
    CHECK_EQ(node.rate_limiter()->options().max_requests, uint32_t{1});

    auto from = net::SocketAddress::from_string("10.0.0.1:6881").value();
    auto a = crypto::Keypair::generate();
    auto b = crypto::Keypair::generate();
    node.handler()->handle_request(rpc, from, 1, cold_get(a));
    node.handler()->handle_request(rpc, from, 2, cold_get(b));
    node.refresh_pool()->wait_idle();

    CHECK_EQ(rpc.lookup_count(), size_t{1});
    CHECK_EQ(node.resolver()->stats().limited, uint64_t{1});
    CHECK_EQ(fallback.count(), size_t{2});

    auto resolvers = rpc.last_resolvers();
    CHECK(resolvers.has_value());
    if (resolvers) {
        CHECK_EQ(resolvers->size(), size_t{1});
        CHECK_EQ(resolvers->front().port, uint16_t{6881});
    }

    node.shutdown();
    CHECK(!node.is_running());
    CHECK(node.handler() == nullptr);
    CHECK(node.cache() == nullptr);
    node.shutdown();
}

TEST_CASE(Node, rejects_unusable_options) {
    server::ServerConfig config;
    config.cache_size = 0;

    test::FakeRpc rpc;
    test::FakeFallback fallback;
    server::Node node(config, rpc, fallback);
    CHECK_ERR_CODE(node.init(), core::ErrorCode::CONFIG_INVALID);
    CHECK(!node.is_running());
    CHECK(node.handler() == nullptr);
    CHECK(node.refresh_pool() == nullptr);
}

TEST_CASE(Node, init_twice_keeps_state) {
    test::FakeRpc rpc;
    test::FakeFallback fallback;
    server::Node node(server::ServerConfig{}, rpc, fallback);
    CHECK_OK(node.init());
    pkarr::Cache* first = node.cache();
    CHECK_OK(node.init());
    CHECK(node.cache() == first);
}

// ============================================================================
// Log files
// ============================================================================

TEST_CASE(LoggingInit, rotates_large_file) {
    auto path = temp_path("rotate.log");
    auto rotated = path;
    rotated += ".1";
    std::filesystem::remove(path);
    std::filesystem::remove(rotated);

    {
        std::ofstream out(path);
        out << std::string(2048, 'x');
    }

    CHECK(!server::rotate_log_file(path, 4096));
    CHECK(std::filesystem::exists(path));

    CHECK(server::rotate_log_file(path, 1024));
    CHECK(!std::filesystem::exists(path));
    CHECK(std::filesystem::exists(rotated));
    if (std::filesystem::exists(rotated)) {
        CHECK_EQ(std::filesystem::file_size(rotated), std::uintmax_t{2048});
    }

    std::filesystem::remove(rotated);
}

TEST_CASE(LoggingInit, missing_file_is_not_rotated) {
    auto path = temp_path("absent.log");
    std::filesystem::remove(path);
    CHECK(!server::rotate_log_file(path, 1));
}

TEST_CASE(LoggingInit, banner_names_settings) {
    server::ServerConfig config;
    config.resolvers.push_back(
        net::SocketAddress::from_string("192.0.2.1:6881").value());
    std::string banner = server::get_startup_banner(config);
    CHECK(banner.find("Pkarr v0.1.0") != std::string::npos);
    CHECK(banner.find("192.0.2.1:6881") != std::string::npos);
    CHECK(banner.find("30s - 86400s") != std::string::npos);
}
