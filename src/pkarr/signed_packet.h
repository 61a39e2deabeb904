#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "crypto/ed25519.h"
#include "dns/packet.h"
#include "pkarr/bep44.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pkarr {

/// Default lower bound for the TTL of a cached packet: 30 seconds.
inline constexpr uint32_t DEFAULT_MINIMUM_TTL = 30;
/// Default upper bound for the TTL of a cached packet: 24 hours.
inline constexpr uint32_t DEFAULT_MAXIMUM_TTL = 24 * 60 * 60;

// ---------------------------------------------------------------------------
// SignedPacket -- a DNS message published under an Ed25519 key.
// ---------------------------------------------------------------------------
// Wraps a verified MutableItem whose payload decodes as a DNS message.
// Instances are immutable; a newer publication is a new SignedPacket.
// ---------------------------------------------------------------------------
class SignedPacket {
public:
    /// Sign an already encoded DNS message.  Fails with DNS_MALFORMED if
    /// the payload does not decode.
    static core::Result<SignedPacket> from_record_payload(
        const crypto::Keypair& keypair, std::vector<uint8_t> payload);

    /// Encode and sign @p packet, sequenced by the wall clock.
    static core::Result<SignedPacket> from_packet(
        const crypto::Keypair& keypair, const dns::Packet& packet);

    /// Encode and sign @p packet under an explicit sequence number.
    static core::Result<SignedPacket> from_packet(
        const crypto::Keypair& keypair, const dns::Packet& packet,
        uint64_t sequence);

    /// Wrap an item already verified by the BEP44 layer.
    static core::Result<SignedPacket> from_item(MutableItem item);

    /// Parse and verify a relay body for @p public_key.
    static core::Result<SignedPacket> from_relay_payload(
        const crypto::PublicKey& public_key, std::span<const uint8_t> bytes);

    /// Inverse of to_bytes(): public_key(32) || relay body.
    static core::Result<SignedPacket> from_bytes(std::span<const uint8_t> bytes);

    [[nodiscard]] const MutableItem& item() const noexcept { return item_; }
    [[nodiscard]] const crypto::PublicKey& public_key() const noexcept {
        return item_.public_key();
    }
    [[nodiscard]] const crypto::Signature& signature() const noexcept {
        return item_.signature();
    }
    [[nodiscard]] uint64_t sequence() const noexcept { return item_.sequence(); }
    [[nodiscard]] const std::vector<uint8_t>& payload() const noexcept {
        return item_.payload();
    }
    [[nodiscard]] const dns::Packet& packet() const noexcept { return packet_; }
    [[nodiscard]] dht::Id target() const { return item_.target(); }

    /// Smallest answer TTL clamped into [min_ttl, max_ttl]; a packet
    /// without answers gets min_ttl.
    [[nodiscard]] uint32_t ttl(uint32_t min_ttl, uint32_t max_ttl) const;

    /// True if this packet supersedes @p other: strictly greater sequence.
    /// Equal sequences are duplicates.
    [[nodiscard]] bool more_recent_than(const SignedPacket& other) const noexcept {
        return sequence() > other.sequence();
    }

    [[nodiscard]] std::vector<uint8_t> to_relay_payload() const {
        return item_.to_wire();
    }

    /// public_key(32) || sig(64) || seq(8, big-endian) || payload.
    [[nodiscard]] std::vector<uint8_t> to_bytes() const;

    /// Multi-line dump: key, sequence, then one line per answer.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const SignedPacket& o) const { return item_ == o.item_; }

private:
    SignedPacket(MutableItem item, dns::Packet packet)
        : item_(std::move(item)), packet_(std::move(packet)) {}

    MutableItem item_;
    dns::Packet packet_;
};

}  // namespace pkarr
