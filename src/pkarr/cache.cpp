// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pkarr/cache.h"

#include "core/logging.h"

#include <algorithm>
#include <stdexcept>

namespace pkarr {

// ---------------------------------------------------------------------------
// CacheEntry
// ---------------------------------------------------------------------------

uint32_t CacheEntry::expires_in(uint32_t min_ttl, uint32_t max_ttl,
                                int64_t now) const {
    const int64_t ttl = packet.ttl(min_ttl, max_ttl);
    // A clock that went backwards counts as no time elapsed.
    const int64_t elapsed = std::max<int64_t>(0, now - stored_at);
    if (elapsed >= ttl) return 0;
    return static_cast<uint32_t>(ttl - elapsed);
}

const char* put_outcome_name(PutOutcome outcome) noexcept {
    switch (outcome) {
    case PutOutcome::INSERTED: return "inserted";
    case PutOutcome::REPLACED: return "replaced";
    case PutOutcome::IGNORED:  return "ignored";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Cache
// ---------------------------------------------------------------------------

Cache::Cache(size_t capacity, core::Clock clock)
    : capacity_(capacity), clock_(std::move(clock)) {
    if (capacity_ == 0) {
        throw std::invalid_argument("Cache: capacity must be > 0");
    }
    if (!clock_) {
        throw std::invalid_argument("Cache: clock must be set");
    }
}

std::shared_ptr<const CacheEntry> Cache::get(const dht::Id& target) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(target);
    if (it == entries_.end()) return nullptr;
    touch_locked(it->second);
    return it->second.entry;
}

std::shared_ptr<const CacheEntry> Cache::get(
    const crypto::PublicKey& public_key) {
    return get(target_for(public_key));
}

PutOutcome Cache::put(const SignedPacket& packet) {
    const dht::Id target = packet.target();
    auto entry = std::make_shared<const CacheEntry>(
        CacheEntry{packet, clock_()});

    std::lock_guard lock(mutex_);
    auto it = entries_.find(target);
    if (it != entries_.end()) {
        Slot& slot = it->second;
        if (!packet.more_recent_than(slot.entry->packet)) {
            LOG_TRACE(core::LogCategory::CACHE,
                      "ignoring seq " + std::to_string(packet.sequence()) +
                      " for " + packet.public_key().to_zbase32() +
                      ", have seq " +
                      std::to_string(slot.entry->packet.sequence()));
            return PutOutcome::IGNORED;
        }
        slot.entry = std::move(entry);
        touch_locked(slot);
        LOG_DEBUG(core::LogCategory::CACHE,
                  "replaced " + packet.public_key().to_zbase32() +
                  " with seq " + std::to_string(packet.sequence()));
        return PutOutcome::REPLACED;
    }

    lru_.push_front(target);
    entries_.emplace(target, Slot{std::move(entry), lru_.begin()});
    LOG_DEBUG(core::LogCategory::CACHE,
              "stored " + packet.public_key().to_zbase32() +
              " seq " + std::to_string(packet.sequence()));

    while (entries_.size() > capacity_) {
        evict_locked();
    }
    return PutOutcome::INSERTED;
}

bool Cache::erase(const dht::Id& target) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(target);
    if (it == entries_.end()) return false;
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
    return true;
}

size_t Cache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void Cache::touch_locked(Slot& slot) {
    lru_.splice(lru_.begin(), lru_, slot.lru_pos);
}

void Cache::evict_locked() {
    if (lru_.empty()) return;
    const dht::Id victim = lru_.back();
    lru_.pop_back();
    entries_.erase(victim);
    LOG_TRACE(core::LogCategory::CACHE, "evicted " + victim.to_hex());
}

}  // namespace pkarr
