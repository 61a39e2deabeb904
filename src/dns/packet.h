#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// DNS message codec (RFC 1035 section 4).
//
// Signed packets carry a complete DNS message as their payload.  Resource
// record data is kept as raw bytes except for the record types whose RDATA
// embeds a domain name (NS, CNAME, PTR, MX); those names are decompressed
// on decode so every record can be re-encoded on its own.  Encoding never
// emits compression pointers.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/error.h"

namespace dns {

inline constexpr size_t HEADER_SIZE     = 12;
inline constexpr size_t MAX_LABEL_SIZE  = 63;
inline constexpr size_t MAX_NAME_SIZE   = 255;
inline constexpr size_t MAX_STRING_SIZE = 255;

enum class RecordType : uint16_t {
    A     = 1,
    NS    = 2,
    CNAME = 5,
    SOA   = 6,
    PTR   = 12,
    MX    = 15,
    TXT   = 16,
    AAAA  = 28,
    SRV   = 33,
    SVCB  = 64,
    HTTPS = 65,
};

inline constexpr uint16_t CLASS_IN = 1;

/// Mnemonic for a record type ("TXT", "AAAA", ...) or "TYPE<n>".
[[nodiscard]] std::string record_type_name(uint16_t type);

struct Header {
    uint16_t id     = 0;
    bool     qr     = false;
    uint8_t  opcode = 0;
    bool     aa     = false;
    bool     tc     = false;
    bool     rd     = false;
    bool     ra     = false;
    uint8_t  rcode  = 0;

    [[nodiscard]] uint16_t flags() const noexcept;
    static Header from_flags(uint16_t id, uint16_t flags) noexcept;

    bool operator==(const Header&) const = default;
};

struct Question {
    std::string name;
    uint16_t    type  = static_cast<uint16_t>(RecordType::A);
    uint16_t    klass = CLASS_IN;

    bool operator==(const Question&) const = default;
};

class ResourceRecord {
public:
    std::string          name;
    uint16_t             type  = 0;
    uint16_t             klass = CLASS_IN;
    uint32_t             ttl   = 0;
    std::vector<uint8_t> rdata;

    // -- Builders for the record types publishers use most ------------------

    static ResourceRecord a(std::string name, std::array<uint8_t, 4> addr,
                            uint32_t ttl);
    static ResourceRecord aaaa(std::string name,
                               std::array<uint8_t, 16> addr, uint32_t ttl);
    /// Throws std::runtime_error if @p target is not an encodable name.
    static ResourceRecord cname(std::string name, std::string_view target,
                                uint32_t ttl);
    /// TXT text longer than 255 bytes is split into several
    /// character-strings.
    static ResourceRecord txt(std::string name, std::string_view text,
                              uint32_t ttl);

    /// Concatenated character-strings of a TXT record, or nullopt if this
    /// is not a well-formed TXT record.
    [[nodiscard]] std::optional<std::string> txt_data() const;

    /// One-line presentation form, e.g. `_foo 30 IN TXT "bar"`.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const ResourceRecord&) const = default;
};

class Packet {
public:
    Header                      header;
    std::vector<Question>       questions;
    std::vector<ResourceRecord> answers;
    std::vector<ResourceRecord> authorities;
    std::vector<ResourceRecord> additionals;

    /// Empty response message (QR set) with the given id.
    static Packet new_reply(uint16_t id);

    /// Parse a wire-format message.  Fails with DNS_MALFORMED on truncated
    /// input, bad label encodings, forward or looping compression pointers
    /// and trailing garbage.
    static core::Result<Packet> decode(std::span<const uint8_t> data);

    /// Serialize to wire format with uncompressed names.  Fails with
    /// DNS_TOO_LARGE if a label, name, section or RDATA exceeds its limit.
    [[nodiscard]] core::Result<std::vector<uint8_t>> encode() const;

    /// Smallest TTL across the answer section, or nullopt if it is empty.
    [[nodiscard]] std::optional<uint32_t> min_answer_ttl() const;

    bool operator==(const Packet&) const = default;
};

}  // namespace dns
