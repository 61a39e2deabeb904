// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "server/resolver.h"

#include "core/logging.h"
#include "pkarr/bep44.h"

#include <string>
#include <variant>

namespace server {

namespace {

/// Token sent with cached answers.  The requester must `get` again from a
/// storing node before it can `put`.
const dht::Token CACHE_TOKEN = {0, 0, 0, 0};

} // anonymous namespace

const char* get_outcome_name(GetOutcome outcome) noexcept {
    switch (outcome) {
    case GetOutcome::SERVED_FRESH:      return "served-fresh";
    case GetOutcome::SERVED_REFRESHING: return "served-refreshing";
    case GetOutcome::SERVED_LIMITED:    return "served-limited";
    case GetOutcome::SERVED_DROPPED:    return "served-dropped";
    case GetOutcome::MISS_REFRESHING:   return "miss-refreshing";
    case GetOutcome::MISS_LIMITED:      return "miss-limited";
    case GetOutcome::MISS_DROPPED:      return "miss-dropped";
    }
    return "unknown";
}

Resolver::Resolver(pkarr::Cache& cache,
                   RateLimiter& rate_limiter,
                   RefreshPool& refresh_pool,
                   dht::RequestHandler& fallback,
                   Options options)
    : cache_(cache),
      rate_limiter_(rate_limiter),
      refresh_pool_(refresh_pool),
      fallback_(fallback),
      options_(options) {}

void Resolver::handle_request(dht::Rpc& rpc,
                              const net::SocketAddress& from,
                              uint16_t transaction_id,
                              const dht::Request& request) {
    if (const auto* get = std::get_if<dht::GetValueRequest>(&request.kind)) {
        // A cache hit is not forwarded so the requester gets one reply.
        if (!is_miss(handle_get(rpc, from, transaction_id, *get))) {
            return;
        }
    }

    delegated_.fetch_add(1, std::memory_order_relaxed);
    fallback_.handle_request(rpc, from, transaction_id, request);
}

GetOutcome Resolver::handle_get(dht::Rpc& rpc,
                                const net::SocketAddress& from,
                                uint16_t transaction_id,
                                const dht::GetValueRequest& request) {
    const dht::Id& target = request.target;
    auto entry = cache_.get(target);

    if (entry) {
        rpc.respond(from, transaction_id,
                    entry->packet.item().to_get_response(rpc.id(),
                                                         CACHE_TOKEN));
        served_.fetch_add(1, std::memory_order_relaxed);

        uint32_t remaining = entry->expires_in(
            options_.minimum_ttl, options_.maximum_ttl, cache_.now());
        if (remaining > 0) {
            LOG_TRACE(core::LogCategory::RESOLVER,
                      "served " + target.to_hex() + " to " +
                      from.to_string() + ", fresh for " +
                      std::to_string(remaining) + "s");
            return GetOutcome::SERVED_FRESH;
        }

        switch (maybe_refresh(from, target)) {
        case Refresh::QUEUED:  return GetOutcome::SERVED_REFRESHING;
        case Refresh::LIMITED: return GetOutcome::SERVED_LIMITED;
        case Refresh::DROPPED: return GetOutcome::SERVED_DROPPED;
        }
        return GetOutcome::SERVED_DROPPED;
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    switch (maybe_refresh(from, target)) {
    case Refresh::QUEUED:  return GetOutcome::MISS_REFRESHING;
    case Refresh::LIMITED: return GetOutcome::MISS_LIMITED;
    case Refresh::DROPPED: return GetOutcome::MISS_DROPPED;
    }
    return GetOutcome::MISS_DROPPED;
}

Resolver::Refresh Resolver::maybe_refresh(const net::SocketAddress& from,
                                          const dht::Id& target) {
    if (rate_limiter_.is_limited(from.addr)) {
        limited_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG(core::LogCategory::RATELIMIT,
                  "not refreshing " + target.to_hex() + ": " +
                  from.addr.to_string() + " is rate limited");
        return Refresh::LIMITED;
    }

    switch (refresh_pool_.submit(target)) {
    case RefreshPool::Submit::QUEUED:
        refreshes_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG(core::LogCategory::RESOLVER,
                  "refresh " + target.to_hex() + " for " + from.to_string());
        return Refresh::QUEUED;
    case RefreshPool::Submit::COALESCED:
        LOG_DEBUG(core::LogCategory::RESOLVER,
                  "refresh " + target.to_hex() + " already in flight");
        return Refresh::QUEUED;
    case RefreshPool::Submit::DROPPED:
        break;
    }
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return Refresh::DROPPED;
}

Resolver::Stats Resolver::stats() const noexcept {
    Stats s;
    s.served    = served_.load(std::memory_order_relaxed);
    s.misses    = misses_.load(std::memory_order_relaxed);
    s.refreshes = refreshes_.load(std::memory_order_relaxed);
    s.limited   = limited_.load(std::memory_order_relaxed);
    s.dropped   = dropped_.load(std::memory_order_relaxed);
    s.delegated = delegated_.load(std::memory_order_relaxed);
    return s;
}

}  // namespace server
