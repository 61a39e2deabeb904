#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// RefreshPool -- background DHT lookups feeding the cache.
// ---------------------------------------------------------------------------
// The resolver answers from cache on the dispatch thread and hands stale or
// missing targets to this pool.  submit() never blocks: the target goes
// into a bounded queue drained by a fixed set of worker threads, and a
// target that is already queued or being looked up is not queued twice.
//
// A worker issues one blocking get_mutable() per target, verifies every
// value returned and offers the valid ones to the cache, which keeps only
// strictly newer sequences.  Failed lookups are logged and not retried.
// ---------------------------------------------------------------------------

#include "core/channel.h"
#include "dht/messages.h"
#include "dht/rpc.h"
#include "net/address.h"
#include "pkarr/cache.h"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <unordered_set>
#include <vector>

namespace server {

class RefreshPool {
public:
    struct Options {
        size_t num_threads    = 4;
        size_t queue_capacity = 1024;
        /// Query only these nodes instead of traversing the DHT.
        std::optional<std::vector<net::SocketAddress>> resolvers;
    };

    /// Outcome of submit().
    enum class Submit {
        QUEUED,
        COALESCED,   ///< Target already queued or in flight.
        DROPPED,     ///< Queue full or pool stopped.
    };

    RefreshPool(dht::Rpc& rpc, pkarr::Cache& cache, Options options);
    ~RefreshPool();

    RefreshPool(const RefreshPool&) = delete;
    RefreshPool& operator=(const RefreshPool&) = delete;

    /// Spawn the worker threads.  Idempotent.
    void start();

    /// Close the queue and join the workers.  Lookups already running
    /// complete; queued ones are discarded.
    void stop();

    /// Queue a lookup for @p target.  Never blocks.
    Submit submit(const dht::Id& target);

    /// Block until no lookup is queued or running.
    void wait_idle();

    /// Targets queued or being looked up.
    [[nodiscard]] size_t pending() const;

    [[nodiscard]] uint64_t lookups_completed() const noexcept {
        return completed_.load(std::memory_order_relaxed);
    }

private:
    void worker_loop(std::stop_token stoken);
    void refresh(const dht::Id& target);
    void finish(const dht::Id& target);

    dht::Rpc&      rpc_;
    pkarr::Cache&  cache_;
    const Options  options_;

    core::MpmcChannel<dht::Id> queue_;
    std::vector<std::jthread>  workers_;
    std::atomic<bool>          running_{false};
    std::atomic<uint64_t>      completed_{0};

    std::unordered_set<dht::Id> in_flight_;
    mutable std::mutex          in_flight_mutex_;
    std::condition_variable     idle_cv_;
};

}  // namespace server
