// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pkarr/signed_packet.h"

#include "core/logging.h"

#include <algorithm>

namespace pkarr {

core::Result<SignedPacket> SignedPacket::from_record_payload(
    const crypto::Keypair& keypair, std::vector<uint8_t> payload) {
    PKARR_TRY_ASSIGN(packet, dns::Packet::decode(payload));
    PKARR_TRY_ASSIGN(item,
        MutableItem::build_from_signing(keypair, std::move(payload)));
    return SignedPacket{std::move(item), std::move(packet)};
}

core::Result<SignedPacket> SignedPacket::from_packet(
    const crypto::Keypair& keypair, const dns::Packet& packet) {
    PKARR_TRY_ASSIGN(payload, packet.encode());
    PKARR_TRY_ASSIGN(item,
        MutableItem::build_from_signing(keypair, std::move(payload)));
    return SignedPacket{std::move(item), packet};
}

core::Result<SignedPacket> SignedPacket::from_packet(
    const crypto::Keypair& keypair, const dns::Packet& packet,
    uint64_t sequence) {
    PKARR_TRY_ASSIGN(payload, packet.encode());
    PKARR_TRY_ASSIGN(item, MutableItem::build_with_sequence(
                               keypair, std::move(payload), sequence));
    return SignedPacket{std::move(item), packet};
}

core::Result<SignedPacket> SignedPacket::from_item(MutableItem item) {
    auto packet = dns::Packet::decode(item.payload());
    if (!packet.ok()) {
        LOG_DEBUG(core::LogCategory::DNS,
                  "signed value from " + item.public_key().to_zbase32() +
                  " is not a DNS message: " + packet.error().message());
        return std::move(packet).error();
    }
    return SignedPacket{std::move(item), std::move(packet).value()};
}

core::Result<SignedPacket> SignedPacket::from_relay_payload(
    const crypto::PublicKey& public_key, std::span<const uint8_t> bytes) {
    PKARR_TRY_ASSIGN(item, MutableItem::parse_relay(public_key, bytes));
    return from_item(std::move(item));
}

core::Result<SignedPacket> SignedPacket::from_bytes(
    std::span<const uint8_t> bytes) {
    if (bytes.size() < crypto::ED25519_PUBLIC_KEY_SIZE) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
            "signed packet shorter than a public key: " +
            std::to_string(bytes.size()) + " bytes");
    }
    PKARR_TRY_ASSIGN(public_key, crypto::PublicKey::from_bytes(
                                     bytes.first(crypto::ED25519_PUBLIC_KEY_SIZE)));
    return from_relay_payload(public_key,
                              bytes.subspan(crypto::ED25519_PUBLIC_KEY_SIZE));
}

uint32_t SignedPacket::ttl(uint32_t min_ttl, uint32_t max_ttl) const {
    const uint32_t record_ttl = packet_.min_answer_ttl().value_or(min_ttl);
    return std::min(max_ttl, std::max(min_ttl, record_ttl));
}

std::vector<uint8_t> SignedPacket::to_bytes() const {
    std::vector<uint8_t> out(public_key().bytes().begin(),
                             public_key().bytes().end());
    const auto body = item_.to_wire();
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::string SignedPacket::to_string() const {
    std::string out = "SignedPacket (" + public_key().to_zbase32() + "):\n";
    out += "    sequence:  " + std::to_string(sequence()) + "\n";
    out += "    signature: " + signature().to_hex() + "\n";
    out += "    records:\n";
    for (const auto& rr : packet_.answers) {
        out += "        " + rr.to_string() + "\n";
    }
    return out;
}

}  // namespace pkarr
