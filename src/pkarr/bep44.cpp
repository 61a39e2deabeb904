// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pkarr/bep44.h"

#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"
#include "core/time.h"
#include "crypto/sha1.h"

#include <algorithm>
#include <string>

namespace pkarr {

namespace {

core::Result<void> check_value_size(size_t size) {
    if (size > MAX_VALUE_SIZE) {
        return core::make_error(core::ErrorCode::VALIDATION_PAYLOAD_TOO_LARGE,
            "mutable item value is " + std::to_string(size) +
            " bytes, limit is " + std::to_string(MAX_VALUE_SIZE));
    }
    return core::make_ok();
}

}  // namespace

// ===========================================================================
// Free functions
// ===========================================================================

std::vector<uint8_t> signable(uint64_t sequence,
                              std::span<const uint8_t> payload) {
    const std::string prefix = "3:seqi" + std::to_string(sequence) +
                               "e1:v" + std::to_string(payload.size()) + ":";
    std::vector<uint8_t> out;
    out.reserve(prefix.size() + payload.size());
    out.insert(out.end(), prefix.begin(), prefix.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

dht::Id target_for(const crypto::PublicKey& key,
                   std::span<const uint8_t> salt) {
    crypto::Sha1Hasher hasher;
    hasher.write(key.bytes());
    hasher.write(salt);
    return hasher.finalize();
}

// ===========================================================================
// Construction
// ===========================================================================

core::Result<MutableItem> MutableItem::verified(
    const crypto::PublicKey& public_key, const crypto::Signature& sig,
    uint64_t sequence, std::vector<uint8_t> payload) {
    PKARR_TRY_VOID(check_value_size(payload.size()));
    PKARR_TRY_VOID(public_key.verify(signable(sequence, payload), sig));
    return MutableItem{public_key, sig, sequence, std::move(payload)};
}

core::Result<MutableItem> MutableItem::parse_relay(
    const crypto::PublicKey& public_key, std::span<const uint8_t> bytes) {
    if (bytes.size() < SIGNATURE_SIZE) {
        return core::make_error(core::ErrorCode::PARSE_SIG_TOO_SHORT,
            "relay payload too short for a signature: " +
            std::to_string(bytes.size()));
    }
    if (bytes.size() < RELAY_HEADER_SIZE) {
        return core::make_error(core::ErrorCode::PARSE_SEQ_TOO_SHORT,
            "relay payload too short for a sequence: " +
            std::to_string(bytes.size() - SIGNATURE_SIZE));
    }

    core::SpanReader reader{bytes};
    const auto sig_bytes = core::ser_read_array<core::SpanReader,
                                                SIGNATURE_SIZE>(reader);
    const uint64_t sequence = core::ser_read_u64be(reader);
    std::vector<uint8_t> payload(bytes.begin() + RELAY_HEADER_SIZE,
                                 bytes.end());

    return verified(public_key,
                    crypto::Signature::from_bytes(sig_bytes),
                    sequence, std::move(payload));
}

core::Result<MutableItem> MutableItem::build_from_signing(
    const crypto::Keypair& keypair, std::vector<uint8_t> payload) {
    return build_with_sequence(keypair, std::move(payload),
                               static_cast<uint64_t>(core::get_time_micros()));
}

core::Result<MutableItem> MutableItem::build_with_sequence(
    const crypto::Keypair& keypair, std::vector<uint8_t> payload,
    uint64_t sequence) {
    PKARR_TRY_VOID(check_value_size(payload.size()));
    const crypto::Signature sig = keypair.sign(signable(sequence, payload));
    return MutableItem{keypair.public_key(), sig, sequence, std::move(payload)};
}

core::Result<MutableItem> MutableItem::from_dht(const dht::MutableValue& value) {
    PKARR_TRY_ASSIGN(public_key, crypto::PublicKey::from_bytes(value.k));
    return verified(public_key,
                    crypto::Signature::from_bytes(value.sig),
                    value.seq, value.v);
}

// ===========================================================================
// Encoding
// ===========================================================================

std::vector<uint8_t> MutableItem::to_wire() const {
    core::DataStream s;
    s.reserve(RELAY_HEADER_SIZE + payload_.size());
    core::ser_write_bytes(s, signature_.bytes());
    core::ser_write_u64be(s, sequence_);
    core::ser_write_bytes(s, payload_);
    return s.release();
}

dht::PutMutableRequest MutableItem::to_put_request(dht::Token token) const {
    dht::PutMutableRequest req;
    req.target = target();
    req.token  = std::move(token);
    req.v      = payload_;
    req.k      = public_key_.bytes();
    req.seq    = sequence_;
    req.sig    = signature_.bytes();
    return req;
}

dht::GetMutableResponse MutableItem::to_get_response(
    const dht::Id& responder_id, dht::Token token) const {
    dht::GetMutableResponse resp;
    resp.responder_id = responder_id;
    resp.token        = std::move(token);
    resp.v            = payload_;
    resp.k            = public_key_.bytes();
    resp.seq          = sequence_;
    resp.sig          = signature_.bytes();
    return resp;
}

}  // namespace pkarr
