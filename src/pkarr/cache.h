#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// Signed packet cache
// ---------------------------------------------------------------------------
// Bounded store of the most recent SignedPacket seen for each key, indexed
// by DHT target (SHA1 of the public key) because that is what inbound
// `get` queries carry.
//
// The only consistency rule is the monotonic write: a stored packet is
// replaced only by one with a strictly greater sequence number.  Entries
// are immutable and swapped wholesale, so readers may keep the returned
// pointer after the entry has been replaced or evicted.
//
// Freshness is not evaluated here; get() returns whatever is stored.
//
// Thread safety: all public methods acquire the internal mutex and are safe
// to call from any thread.
// ---------------------------------------------------------------------------

#include "core/time.h"
#include "crypto/ed25519.h"
#include "dht/messages.h"
#include "pkarr/signed_packet.h"

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace pkarr {

struct CacheEntry {
    SignedPacket packet;
    int64_t      stored_at = 0;   ///< Seconds since epoch, from the cache clock.

    /// Seconds until this entry should be refreshed; 0 once expired.
    /// Never negative.
    [[nodiscard]] uint32_t expires_in(uint32_t min_ttl, uint32_t max_ttl,
                                      int64_t now) const;
};

enum class PutOutcome {
    INSERTED,   ///< No entry existed for the key.
    REPLACED,   ///< Strictly newer sequence replaced the stored entry.
    IGNORED,    ///< Stale or duplicate sequence; stored entry unchanged.
};

[[nodiscard]] const char* put_outcome_name(PutOutcome outcome) noexcept;

class Cache {
public:
    /// Default capacity: one million packets.
    static constexpr size_t DEFAULT_CAPACITY = 1'000'000;

    /// @param capacity  Maximum number of entries; the least recently used
    ///                  entry is evicted beyond it.  Must be > 0.
    /// @param clock     Seconds since epoch; stamps stored_at.
    explicit Cache(size_t capacity = DEFAULT_CAPACITY,
                   core::Clock clock = core::system_clock_seconds());

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    /// Entry for @p target or nullptr.  Counts as a use for eviction.
    [[nodiscard]] std::shared_ptr<const CacheEntry> get(const dht::Id& target);
    [[nodiscard]] std::shared_ptr<const CacheEntry> get(
        const crypto::PublicKey& public_key);

    /// Monotonic insert.  A packet with sequence <= the stored one is
    /// dropped.
    PutOutcome put(const SignedPacket& packet);

    /// Remove the entry for @p target.  Returns true if one existed.
    bool erase(const dht::Id& target);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    /// Current time on the cache clock, for CacheEntry::expires_in().
    [[nodiscard]] int64_t now() const { return clock_(); }

private:
    struct Slot {
        std::shared_ptr<const CacheEntry> entry;
        std::list<dht::Id>::iterator      lru_pos;
    };

    const size_t       capacity_;
    const core::Clock  clock_;

    /// Most recently used at the front.
    std::list<dht::Id>                   lru_;
    std::unordered_map<dht::Id, Slot>    entries_;
    mutable std::mutex                   mutex_;

    /// Must be called with mutex_ held.
    void touch_locked(Slot& slot);
    /// Must be called with mutex_ held.
    void evict_locked();
};

}  // namespace pkarr
