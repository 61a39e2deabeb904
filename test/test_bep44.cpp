// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for BEP44 mutable items and signed packets.

#include "test_framework.h"

#include "core/serialize.h"
#include "core/time.h"
#include "crypto/ed25519.h"
#include "crypto/sha1.h"
#include "dns/packet.h"
#include "pkarr/bep44.h"
#include "pkarr/signed_packet.h"

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes_of(std::string_view s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

dns::Packet txt_packet(uint32_t ttl) {
    dns::Packet p = dns::Packet::new_reply(0);
    p.answers.push_back(dns::ResourceRecord::txt("_foo", "bar", ttl));
    return p;
}

} // namespace

// ============================================================================
// Signable encoding and target
// ============================================================================

TEST_CASE(Bep44, signable_is_bencoded_prefix_plus_payload) {
    auto s = pkarr::signable(1, bytes_of("abc"));
    CHECK(s == bytes_of("3:seqi1e1:v3:abc"));

    auto empty = pkarr::signable(1700000000000000ULL, {});
    CHECK(empty == bytes_of("3:seqi1700000000000000e1:v0:"));
}

TEST_CASE(Bep44, target_is_sha1_of_public_key) {
    auto kp = crypto::Keypair::generate();
    CHECK(pkarr::target_for(kp.public_key()) ==
          crypto::sha1(kp.public_key().bytes()));

    auto salted = pkarr::target_for(kp.public_key(), bytes_of("salt"));
    CHECK(salted != pkarr::target_for(kp.public_key()));
}

// ============================================================================
// Relay parsing
// ============================================================================

TEST_CASE(Bep44, empty_relay_payload_is_sig_too_short) {
    auto kp = crypto::Keypair::generate();
    auto r = pkarr::MutableItem::parse_relay(kp.public_key(), {});
    CHECK_ERR_CODE(r, core::ErrorCode::PARSE_SIG_TOO_SHORT);
    CHECK(r.error().message().find(": 0") != std::string::npos);
}

TEST_CASE(Bep44, seventy_bytes_is_seq_too_short) {
    auto kp = crypto::Keypair::generate();
    std::vector<uint8_t> body(70, 0);
    auto r = pkarr::MutableItem::parse_relay(kp.public_key(), body);
    CHECK_ERR_CODE(r, core::ErrorCode::PARSE_SEQ_TOO_SHORT);
    CHECK(r.error().message().find(": 6") != std::string::npos);
}

TEST_CASE(Bep44, every_short_length_reports_missing_part) {
    auto kp = crypto::Keypair::generate();
    for (size_t len = 0; len < pkarr::RELAY_HEADER_SIZE; ++len) {
        std::vector<uint8_t> body(len, 0xab);
        auto r = pkarr::MutableItem::parse_relay(kp.public_key(), body);
        if (len < pkarr::SIGNATURE_SIZE) {
            CHECK_ERR_CODE(r, core::ErrorCode::PARSE_SIG_TOO_SHORT);
            if (!r.ok()) {
                CHECK(r.error().message().ends_with(": " + std::to_string(len)));
            }
        } else {
            CHECK_ERR_CODE(r, core::ErrorCode::PARSE_SEQ_TOO_SHORT);
            if (!r.ok()) {
                CHECK(r.error().message().ends_with(
                    ": " + std::to_string(len - pkarr::SIGNATURE_SIZE)));
            }
        }
    }
}

TEST_CASE(Bep44, header_only_body_is_empty_item) {
    auto kp = crypto::Keypair::generate();
    auto item = pkarr::MutableItem::build_with_sequence(kp, {}, 42);
    CHECK_OK(item);
    auto wire = item.value().to_wire();
    CHECK_EQ(wire.size(), pkarr::RELAY_HEADER_SIZE);

    auto parsed = pkarr::MutableItem::parse_relay(kp.public_key(), wire);
    CHECK_OK(parsed);
    if (parsed.ok()) {
        CHECK_EQ(parsed.value().sequence(), uint64_t{42});
        CHECK(parsed.value().payload().empty());
    }
}

TEST_CASE(Bep44, sign_then_parse_roundtrip) {
    auto kp = crypto::Keypair::generate();
    auto item = pkarr::MutableItem::build_with_sequence(
        kp, bytes_of("hello"), 42);
    CHECK_OK(item);

    auto wire = item.value().to_wire();
    CHECK_EQ(wire.size(), pkarr::RELAY_HEADER_SIZE + 5);

    auto parsed = pkarr::MutableItem::parse_relay(kp.public_key(), wire);
    CHECK_OK(parsed);
    CHECK(parsed.value() == item.value());
    CHECK_EQ(parsed.value().sequence(), uint64_t{42});
    CHECK(parsed.value().payload() == bytes_of("hello"));
}

TEST_CASE(Bep44, sequence_is_big_endian_after_signature) {
    auto kp = crypto::Keypair::generate();
    auto item = pkarr::MutableItem::build_with_sequence(kp, {}, 0x0102);
    auto wire = item.value().to_wire();
    CHECK_EQ(wire.size(), pkarr::RELAY_HEADER_SIZE);
    CHECK_EQ(wire[64 + 6], 0x01);
    CHECK_EQ(wire[64 + 7], 0x02);
}

TEST_CASE(Bep44, parse_with_other_key_fails) {
    auto signer = crypto::Keypair::generate();
    auto other  = crypto::Keypair::generate();
    auto item = pkarr::MutableItem::build_with_sequence(
        signer, bytes_of("v"), 1);
    CHECK_ERR_CODE(pkarr::MutableItem::parse_relay(other.public_key(),
                                                   item.value().to_wire()),
                   core::ErrorCode::CRYPTO_INVALID_SIGNATURE);
}

TEST_CASE(Bep44, tampered_sequence_fails) {
    auto kp = crypto::Keypair::generate();
    auto wire = pkarr::MutableItem::build_with_sequence(
        kp, bytes_of("v"), 1).value().to_wire();
    wire[71] = 2;
    CHECK_ERR_CODE(pkarr::MutableItem::parse_relay(kp.public_key(), wire),
                   core::ErrorCode::CRYPTO_INVALID_SIGNATURE);
}

TEST_CASE(Bep44, oversized_value_rejected) {
    auto kp = crypto::Keypair::generate();
    std::vector<uint8_t> big(pkarr::MAX_VALUE_SIZE + 1, 'x');
    CHECK_ERR_CODE(pkarr::MutableItem::build_with_sequence(kp, big, 1),
                   core::ErrorCode::VALIDATION_PAYLOAD_TOO_LARGE);

    std::vector<uint8_t> max(pkarr::MAX_VALUE_SIZE, 'x');
    CHECK_OK(pkarr::MutableItem::build_with_sequence(kp, max, 1));
}

TEST_CASE(Bep44, from_dht_verifies) {
    auto kp = crypto::Keypair::generate();
    auto item = pkarr::MutableItem::build_with_sequence(
        kp, bytes_of("payload"), 9).value();

    auto put = item.to_put_request({1, 2});
    CHECK(put.target == item.target());

    dht::MutableValue value;
    value.k   = put.k;
    value.seq = put.seq;
    value.v   = put.v;
    value.sig = put.sig;
    CHECK_OK(pkarr::MutableItem::from_dht(value));

    value.v.push_back('!');
    CHECK_ERR_CODE(pkarr::MutableItem::from_dht(value),
                   core::ErrorCode::CRYPTO_INVALID_SIGNATURE);
}

TEST_CASE(Bep44, clock_sequence_uses_microseconds) {
    auto kp = crypto::Keypair::generate();
    const int64_t before = core::get_time_micros();
    auto item = pkarr::MutableItem::build_from_signing(kp, bytes_of("x"));
    const int64_t after = core::get_time_micros();
    CHECK_OK(item);
    CHECK(item.value().sequence() >= static_cast<uint64_t>(before));
    CHECK(item.value().sequence() <= static_cast<uint64_t>(after));
}

// ============================================================================
// SignedPacket
// ============================================================================

TEST_CASE(SignedPacket, from_packet_then_relay_roundtrip) {
    auto kp = crypto::Keypair::generate();
    auto sp = pkarr::SignedPacket::from_packet(kp, txt_packet(30), 5);
    CHECK_OK(sp);

    auto back = pkarr::SignedPacket::from_relay_payload(
        kp.public_key(), sp.value().to_relay_payload());
    CHECK_OK(back);
    CHECK(back.value() == sp.value());
    CHECK_EQ(back.value().packet().answers.size(), size_t{1});
    CHECK(back.value().packet().answers[0].txt_data() ==
          std::optional<std::string>("bar"));
}

TEST_CASE(SignedPacket, bytes_roundtrip) {
    auto kp = crypto::Keypair::generate();
    auto sp = pkarr::SignedPacket::from_packet(kp, txt_packet(30), 5).value();

    auto bytes = sp.to_bytes();
    CHECK_EQ(bytes.size(), 32 + sp.to_relay_payload().size());

    auto back = pkarr::SignedPacket::from_bytes(bytes);
    CHECK_OK(back);
    CHECK(back.value() == sp);
    CHECK(back.value().public_key() == kp.public_key());

    std::vector<uint8_t> short_bytes(bytes.begin(), bytes.begin() + 10);
    CHECK_ERR_CODE(pkarr::SignedPacket::from_bytes(short_bytes),
                   core::ErrorCode::PARSE_BAD_FORMAT);
}

TEST_CASE(SignedPacket, undecodable_payload_rejected) {
    auto kp = crypto::Keypair::generate();
    CHECK_ERR_CODE(
        pkarr::SignedPacket::from_record_payload(kp, bytes_of("not dns")),
        core::ErrorCode::DNS_MALFORMED);

    // A valid signature over a non-DNS payload is still not a packet.
    auto item = pkarr::MutableItem::build_with_sequence(
        kp, bytes_of("not dns"), 1);
    CHECK_ERR_CODE(pkarr::SignedPacket::from_item(item.value()),
                   core::ErrorCode::DNS_MALFORMED);
}

TEST_CASE(SignedPacket, ttl_is_clamped) {
    auto kp = crypto::Keypair::generate();
    const uint32_t min = pkarr::DEFAULT_MINIMUM_TTL;
    const uint32_t max = pkarr::DEFAULT_MAXIMUM_TTL;

    auto low = pkarr::SignedPacket::from_packet(kp, txt_packet(10), 1).value();
    CHECK_EQ(low.ttl(min, max), uint32_t{30});

    auto mid = pkarr::SignedPacket::from_packet(kp, txt_packet(3600), 1).value();
    CHECK_EQ(mid.ttl(min, max), uint32_t{3600});

    auto high =
        pkarr::SignedPacket::from_packet(kp, txt_packet(100000), 1).value();
    CHECK_EQ(high.ttl(min, max), uint32_t{86400});

    auto empty = pkarr::SignedPacket::from_packet(
        kp, dns::Packet::new_reply(0), 1).value();
    CHECK_EQ(empty.ttl(min, max), uint32_t{30});
}

TEST_CASE(SignedPacket, more_recent_than_is_strict) {
    auto kp = crypto::Keypair::generate();
    auto a = pkarr::SignedPacket::from_packet(kp, txt_packet(30), 100).value();
    auto b = pkarr::SignedPacket::from_packet(kp, txt_packet(60), 100).value();
    auto c = pkarr::SignedPacket::from_packet(kp, txt_packet(30), 101).value();

    CHECK(!a.more_recent_than(b));
    CHECK(!b.more_recent_than(a));
    CHECK(c.more_recent_than(a));
    CHECK(!a.more_recent_than(c));
}

TEST_CASE(SignedPacket, to_string_lists_records) {
    auto kp = crypto::Keypair::generate();
    auto sp = pkarr::SignedPacket::from_packet(kp, txt_packet(30), 7).value();
    std::string text = sp.to_string();
    CHECK(text.find(kp.public_key().to_zbase32()) != std::string::npos);
    CHECK(text.find("sequence:  7") != std::string::npos);
    CHECK(text.find("_foo 30 IN TXT \"bar\"") != std::string::npos);
}
