#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Node -- owns the caching resolver stack built from a ServerConfig.
//
//   1. Construction:  stores the config and the engine seams.  Nothing is
//                     created yet.
//   2. init():        creates cache -> rate limiter -> refresh pool ->
//                     resolver -> client and starts the refresh workers.
//   3. shutdown():    stops the workers and destroys the subsystems in
//                     reverse order.
//
// Once initialized, handler() is installed as the DHT engine's request
// handler.  The engine and the fallback handler must outlive the Node.
// ---------------------------------------------------------------------------

#ifndef PKARR_SERVER_NODE_H
#define PKARR_SERVER_NODE_H

#include "core/error.h"
#include "dht/rpc.h"
#include "server/context.h"

#include <atomic>
#include <memory>

namespace pkarr {
    class Cache;
    class Client;
} // namespace pkarr

namespace server {

class RateLimiter;
class RefreshPool;
class Resolver;

class Node {
public:
    Node(ServerConfig config, dht::Rpc& rpc, dht::RequestHandler& fallback);

    /// Calls shutdown() if the node is still running.
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /// Build and start every subsystem.  Fails with CONFIG_INVALID if a
    /// subsystem rejects its options; nothing is left running then.
    /// Calling init() on a running node is a no-op.
    [[nodiscard]] core::Result<void> init();

    /// Stop the refresh workers and release the subsystems.  Safe to call
    /// more than once.
    void shutdown();

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }

    /// The request handler to install on the engine, or nullptr before
    /// init().
    [[nodiscard]] dht::RequestHandler* handler() const noexcept;

    // -- Accessors (nullptr when not running) -------------------------------

    [[nodiscard]] pkarr::Cache*  cache() const noexcept { return cache_.get(); }
    [[nodiscard]] pkarr::Client* client() const noexcept { return client_.get(); }
    [[nodiscard]] RateLimiter*   rate_limiter() const noexcept {
        return rate_limiter_.get();
    }
    [[nodiscard]] RefreshPool*   refresh_pool() const noexcept {
        return refresh_pool_.get();
    }
    [[nodiscard]] Resolver*      resolver() const noexcept {
        return resolver_.get();
    }

private:
    void teardown();

    const ServerConfig   config_;
    dht::Rpc&            rpc_;
    dht::RequestHandler& fallback_;

    std::unique_ptr<pkarr::Cache>  cache_;
    std::unique_ptr<RateLimiter>   rate_limiter_;
    std::unique_ptr<RefreshPool>   refresh_pool_;
    std::unique_ptr<Resolver>      resolver_;
    std::unique_ptr<pkarr::Client> client_;

    std::atomic<bool> running_{false};
};

} // namespace server

#endif // PKARR_SERVER_NODE_H
