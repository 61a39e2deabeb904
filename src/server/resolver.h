#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Resolver -- cache-first responder for inbound DHT `get` queries.
// ---------------------------------------------------------------------------
// Installed as the DHT engine's request handler.  For a BEP44 `get`:
//
//   1. A cached packet for the target is returned to the requester at
//      once, fresh or not.
//   2. If the entry is missing or expired and the requester is within its
//      rate allowance, a background lookup is queued on the RefreshPool.
//      A limited requester still gets the cached answer, it just does not
//      trigger network traffic.
//   3. A `get` that was not answered from cache, and every other request
//      kind, is passed unchanged to the fallback handler (normally the
//      engine's default behaviour).
//
// Nothing here throws or reports errors to the requester.
//
// Thread safety: handle_request() may be called concurrently from any
// number of dispatch threads.
// ---------------------------------------------------------------------------

#include "dht/messages.h"
#include "dht/rpc.h"
#include "net/address.h"
#include "pkarr/cache.h"
#include "pkarr/signed_packet.h"
#include "server/rate_limiter.h"
#include "server/refresh_pool.h"

#include <atomic>
#include <cstdint>

namespace server {

/// What the resolver did with one `get`.
enum class GetOutcome {
    SERVED_FRESH,       ///< Answered from a fresh cache entry.
    SERVED_REFRESHING,  ///< Answered from a stale entry, lookup queued.
    SERVED_LIMITED,     ///< Answered from a stale entry, requester limited.
    SERVED_DROPPED,     ///< Answered from a stale entry, refresh queue full.
    MISS_REFRESHING,    ///< Not cached, lookup queued, delegated.
    MISS_LIMITED,       ///< Not cached, requester limited, delegated.
    MISS_DROPPED,       ///< Not cached, refresh queue full, delegated.
};

/// True for the outcomes that sent no answer.
[[nodiscard]] constexpr bool is_miss(GetOutcome outcome) noexcept {
    return outcome == GetOutcome::MISS_REFRESHING ||
           outcome == GetOutcome::MISS_LIMITED ||
           outcome == GetOutcome::MISS_DROPPED;
}

[[nodiscard]] const char* get_outcome_name(GetOutcome outcome) noexcept;

class Resolver : public dht::RequestHandler {
public:
    struct Options {
        uint32_t minimum_ttl = pkarr::DEFAULT_MINIMUM_TTL;
        uint32_t maximum_ttl = pkarr::DEFAULT_MAXIMUM_TTL;
    };

    struct Stats {
        uint64_t served    = 0;
        uint64_t misses    = 0;
        uint64_t refreshes = 0;
        uint64_t limited   = 0;
        uint64_t dropped   = 0;
        uint64_t delegated = 0;
    };

    Resolver(pkarr::Cache& cache,
             RateLimiter& rate_limiter,
             RefreshPool& refresh_pool,
             dht::RequestHandler& fallback,
             Options options);

    void handle_request(dht::Rpc& rpc,
                        const net::SocketAddress& from,
                        uint16_t transaction_id,
                        const dht::Request& request) override;

    /// Serve one `get` from cache and decide whether to refresh.  Does not
    /// delegate.
    GetOutcome handle_get(dht::Rpc& rpc,
                          const net::SocketAddress& from,
                          uint16_t transaction_id,
                          const dht::GetValueRequest& request);

    [[nodiscard]] Stats stats() const noexcept;

private:
    enum class Refresh { QUEUED, LIMITED, DROPPED };

    /// Queue a lookup unless @p from is over its allowance.  A lookup
    /// already in flight for @p target counts as queued.
    Refresh maybe_refresh(const net::SocketAddress& from, const dht::Id& target);

    pkarr::Cache&        cache_;
    RateLimiter&         rate_limiter_;
    RefreshPool&         refresh_pool_;
    dht::RequestHandler& fallback_;
    const Options        options_;

    std::atomic<uint64_t> served_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> refreshes_{0};
    std::atomic<uint64_t> limited_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> delegated_{0};
};

}  // namespace server
