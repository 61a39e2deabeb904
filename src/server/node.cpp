// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server/node.h"

#include "core/logging.h"
#include "pkarr/cache.h"
#include "pkarr/client.h"
#include "server/rate_limiter.h"
#include "server/refresh_pool.h"
#include "server/resolver.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace server {

Node::Node(ServerConfig config, dht::Rpc& rpc, dht::RequestHandler& fallback)
    : config_(std::move(config)), rpc_(rpc), fallback_(fallback) {}

Node::~Node() {
    shutdown();
}

core::Result<void> Node::init() {
    if (is_running()) return core::make_ok();

    LOG_INFO(core::LogCategory::CONFIG, get_startup_banner(config_));

    try {
        cache_ = std::make_unique<pkarr::Cache>(config_.cache_size);
        rate_limiter_ = std::make_unique<RateLimiter>(
            config_.rate_limiter_options());
        refresh_pool_ = std::make_unique<RefreshPool>(
            rpc_, *cache_, config_.refresh_pool_options());

        Resolver::Options resolver_opts;
        resolver_opts.minimum_ttl = config_.minimum_ttl;
        resolver_opts.maximum_ttl = config_.maximum_ttl;
        resolver_ = std::make_unique<Resolver>(
            *cache_, *rate_limiter_, *refresh_pool_, fallback_, resolver_opts);

        pkarr::Client::Options client_opts;
        client_opts.minimum_ttl = config_.minimum_ttl;
        client_opts.maximum_ttl = config_.maximum_ttl;
        if (!config_.resolvers.empty()) {
            client_opts.resolvers = config_.resolvers;
        }
        client_ = std::make_unique<pkarr::Client>(rpc_, *cache_, client_opts);
    } catch (const std::invalid_argument& e) {
        teardown();
        return core::make_error(core::ErrorCode::CONFIG_INVALID,
                                std::string("cannot build resolver: ") +
                                e.what());
    }

    refresh_pool_->start();
    running_.store(true, std::memory_order_release);
    LOG_INFO(core::LogCategory::RESOLVER, "Resolver node started");
    return core::make_ok();
}

void Node::shutdown() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;

    LOG_INFO(core::LogCategory::RESOLVER, "Resolver node shutting down");
    refresh_pool_->stop();
    teardown();
}

void Node::teardown() {
    client_.reset();
    resolver_.reset();
    refresh_pool_.reset();
    rate_limiter_.reset();
    cache_.reset();
}

dht::RequestHandler* Node::handler() const noexcept {
    return resolver_.get();
}

} // namespace server
