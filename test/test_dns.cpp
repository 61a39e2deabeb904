// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// Unit tests for the DNS message codec.

#include "test_framework.h"

#include "core/hex.h"
#include "dns/packet.h"

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> unhex(std::string_view hex) {
    auto v = core::from_hex(hex);
    return v ? *v : std::vector<uint8_t>{};
}

// Response with two answers; the second owner name is a compression
// pointer to the first (offset 12).
//   _foo.example 30 IN TXT "bar"
//   _foo.example 60 IN A   1.2.3.4
const char* COMPRESSED_REPLY =
    "12348400" "0000" "0002" "0000" "0000"
    "045f666f6f076578616d706c6500" "0010" "0001" "0000001e" "0004" "03626172"
    "c00c" "0001" "0001" "0000003c" "0004" "01020304";

} // namespace

TEST_CASE(DNS, encode_decode_preserves_records) {
    dns::Packet p = dns::Packet::new_reply(7);
    p.answers.push_back(dns::ResourceRecord::a("_a", {1, 1, 1, 1}, 30));
    p.answers.push_back(dns::ResourceRecord::aaaa(
        "_aaaa", {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1},
        60));
    p.answers.push_back(dns::ResourceRecord::txt("_foo", "bar", 300));
    p.answers.push_back(dns::ResourceRecord::cname("www", "example.com", 120));

    auto wire = p.encode();
    CHECK_OK(wire);

    auto back = dns::Packet::decode(wire.value());
    CHECK_OK(back);
    CHECK(back.value() == p);
    CHECK(back.value().header.qr);
    CHECK_EQ(back.value().header.id, 7);
}

TEST_CASE(DNS, decode_follows_compression_pointers) {
    auto wire = unhex(COMPRESSED_REPLY);
    auto p = dns::Packet::decode(wire);
    CHECK_OK(p);

    const auto& answers = p.value().answers;
    CHECK_EQ(answers.size(), size_t{2});
    CHECK_EQ(answers[0].name, "_foo.example");
    CHECK_EQ(answers[1].name, "_foo.example");
    CHECK(answers[0].txt_data() == std::optional<std::string>("bar"));
    CHECK_EQ(answers[1].to_string(), "_foo.example 60 IN A 1.2.3.4");
    CHECK(p.value().header.aa);
}

TEST_CASE(DNS, rejects_forward_pointer) {
    // Owner name points at itself.
    auto wire = unhex("00008000" "0000" "0001" "0000" "0000"
                      "c00c" "0001" "0001" "0000003c" "0004" "01020304");
    CHECK_ERR_CODE(dns::Packet::decode(wire), core::ErrorCode::DNS_MALFORMED);
}

TEST_CASE(DNS, rejects_truncated_and_trailing) {
    auto wire = unhex(COMPRESSED_REPLY);

    std::vector<uint8_t> truncated(wire.begin(), wire.end() - 1);
    CHECK_ERR_CODE(dns::Packet::decode(truncated),
                   core::ErrorCode::DNS_MALFORMED);

    std::vector<uint8_t> trailing = wire;
    trailing.push_back(0);
    CHECK_ERR_CODE(dns::Packet::decode(trailing),
                   core::ErrorCode::DNS_MALFORMED);

    std::vector<uint8_t> tiny = {0x00, 0x01};
    CHECK_ERR_CODE(dns::Packet::decode(tiny), core::ErrorCode::DNS_MALFORMED);
}

TEST_CASE(DNS, long_txt_is_split) {
    std::string text(300, 'x');
    auto rr = dns::ResourceRecord::txt("_long", text, 30);
    // 1 + 255 + 1 + 45
    CHECK_EQ(rr.rdata.size(), size_t{302});
    CHECK_EQ(rr.rdata[0], 255);
    CHECK(rr.txt_data() == std::optional<std::string>(text));
}

TEST_CASE(DNS, oversized_label_fails_encode) {
    dns::Packet p = dns::Packet::new_reply(0);
    p.answers.push_back(
        dns::ResourceRecord::a(std::string(64, 'a'), {1, 2, 3, 4}, 30));
    CHECK_ERR_CODE(p.encode(), core::ErrorCode::DNS_TOO_LARGE);
}

TEST_CASE(DNS, min_answer_ttl) {
    dns::Packet p = dns::Packet::new_reply(0);
    CHECK(!p.min_answer_ttl().has_value());

    p.answers.push_back(dns::ResourceRecord::txt("a", "1", 300));
    p.answers.push_back(dns::ResourceRecord::txt("b", "2", 45));
    p.answers.push_back(dns::ResourceRecord::txt("c", "3", 9000));
    CHECK(p.min_answer_ttl() == std::optional<uint32_t>(45));
}

TEST_CASE(DNS, presentation_forms) {
    CHECK_EQ(dns::ResourceRecord::txt("_foo", "bar", 30).to_string(),
             "_foo 30 IN TXT \"bar\"");
    CHECK_EQ(dns::ResourceRecord::cname("www", "example.com", 120).to_string(),
             "www 120 IN CNAME example.com.");
    CHECK_EQ(dns::record_type_name(16), "TXT");
    CHECK_EQ(dns::record_type_name(999), "TYPE999");

    dns::ResourceRecord unknown;
    unknown.name  = "x";
    unknown.type  = 999;
    unknown.ttl   = 5;
    unknown.rdata = {0xab, 0xcd};
    CHECK_EQ(unknown.to_string(), "x 5 IN TYPE999 \\# 2 abcd");
}
