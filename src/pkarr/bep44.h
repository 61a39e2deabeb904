#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// BEP44 mutable items.
//
// A mutable item is a payload `v` signed together with a sequence number
// under an Ed25519 key `k`.  The signature covers the bencoded fragment
//
//     3:seqi<seq>e1:v<len(v)>:<v>
//
// and the item is stored in the DHT under SHA1(k).  Relays transport the
// same item as  sig(64) || seq(8, big-endian) || v.
// ---------------------------------------------------------------------------

#include "core/error.h"
#include "crypto/ed25519.h"
#include "dht/messages.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pkarr {

inline constexpr size_t SIGNATURE_SIZE    = 64;
inline constexpr size_t SEQUENCE_SIZE     = 8;
inline constexpr size_t RELAY_HEADER_SIZE = SIGNATURE_SIZE + SEQUENCE_SIZE;

/// BEP44 caps `v` at 1000 bytes.
inline constexpr size_t MAX_VALUE_SIZE = 1000;

/// The exact byte string covered by the signature.
[[nodiscard]] std::vector<uint8_t> signable(uint64_t sequence,
                                            std::span<const uint8_t> payload);

/// DHT key of a mutable item: SHA1(public_key || salt).
[[nodiscard]] dht::Id target_for(const crypto::PublicKey& key,
                                 std::span<const uint8_t> salt = {});

class MutableItem {
public:
    /// Parse and verify a relay body.
    ///   len < 64          -> PARSE_SIG_TOO_SHORT  (message carries len)
    ///   len < 72          -> PARSE_SEQ_TOO_SHORT  (message carries len-64)
    ///   payload > 1000    -> VALIDATION_PAYLOAD_TOO_LARGE
    ///   bad signature     -> CRYPTO_INVALID_SIGNATURE
    static core::Result<MutableItem> parse_relay(
        const crypto::PublicKey& public_key, std::span<const uint8_t> bytes);

    /// Sign @p payload with the current wall-clock time in microseconds
    /// as its sequence number.
    static core::Result<MutableItem> build_from_signing(
        const crypto::Keypair& keypair, std::vector<uint8_t> payload);

    static core::Result<MutableItem> build_with_sequence(
        const crypto::Keypair& keypair, std::vector<uint8_t> payload,
        uint64_t sequence);

    /// Verify a value received from a DHT node.
    static core::Result<MutableItem> from_dht(const dht::MutableValue& value);

    [[nodiscard]] const crypto::PublicKey& public_key() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const crypto::Signature& signature() const noexcept {
        return signature_;
    }
    [[nodiscard]] uint64_t sequence() const noexcept { return sequence_; }
    [[nodiscard]] const std::vector<uint8_t>& payload() const noexcept {
        return payload_;
    }

    [[nodiscard]] dht::Id target() const { return target_for(public_key_); }

    /// sig(64) || seq(8, big-endian) || payload.  Inverse of parse_relay().
    [[nodiscard]] std::vector<uint8_t> to_wire() const;

    [[nodiscard]] dht::PutMutableRequest to_put_request(dht::Token token) const;

    /// Reply to a `get` for this item's target.
    [[nodiscard]] dht::GetMutableResponse to_get_response(
        const dht::Id& responder_id, dht::Token token) const;

    bool operator==(const MutableItem&) const = default;

private:
    MutableItem(crypto::PublicKey public_key, crypto::Signature signature,
                uint64_t sequence, std::vector<uint8_t> payload)
        : public_key_(public_key),
          signature_(signature),
          sequence_(sequence),
          payload_(std::move(payload)) {}

    static core::Result<MutableItem> verified(
        const crypto::PublicKey& public_key, const crypto::Signature& sig,
        uint64_t sequence, std::vector<uint8_t> payload);

    crypto::PublicKey    public_key_;
    crypto::Signature    signature_;
    uint64_t             sequence_ = 0;
    std::vector<uint8_t> payload_;
};

}  // namespace pkarr
