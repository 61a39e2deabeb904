// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dns/packet.h"

#include "core/hex.h"
#include "core/logging.h"
#include "core/serialize.h"
#include "core/stream.h"

#include <algorithm>
#include <stdexcept>

namespace dns {

// ===========================================================================
// Internal helpers
// ===========================================================================

namespace {

/// Thrown by the encoder when a field exceeds its wire limit; converted
/// to DNS_TOO_LARGE at the public boundary.
class EncodeLimitError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Read a possibly compressed domain name at the reader's cursor and leave
/// the cursor just past it.  Compression pointers must point strictly
/// backwards from the previous jump, which rules out loops.
std::string read_name(core::SpanReader& reader) {
    const auto msg = reader.source();
    size_t pos = reader.tell();
    size_t jump_limit = pos;
    bool jumped = false;
    size_t wire_len = 0;
    std::string name;

    for (;;) {
        if (pos >= msg.size()) {
            throw std::runtime_error("truncated domain name");
        }
        const uint8_t len = msg[pos];

        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= msg.size()) {
                throw std::runtime_error("truncated compression pointer");
            }
            const size_t target = (static_cast<size_t>(len & 0x3F) << 8) |
                                  msg[pos + 1];
            if (!jumped) {
                reader.seek(pos + 2);
                jumped = true;
            }
            if (target >= jump_limit) {
                throw std::runtime_error("invalid compression pointer");
            }
            jump_limit = target;
            pos = target;
            continue;
        }
        if ((len & 0xC0) != 0) {
            throw std::runtime_error("reserved label type");
        }
        if (len == 0) {
            if (!jumped) reader.seek(pos + 1);
            return name;
        }
        if (pos + 1 + len > msg.size()) {
            throw std::runtime_error("truncated label");
        }
        wire_len += 1 + static_cast<size_t>(len);
        if (wire_len + 1 > MAX_NAME_SIZE) {
            throw std::runtime_error("domain name too long");
        }
        if (!name.empty()) name.push_back('.');
        name.append(reinterpret_cast<const char*>(msg.data() + pos + 1), len);
        pos += 1 + static_cast<size_t>(len);
    }
}

template <typename Stream>
void write_name(Stream& s, std::string_view name) {
    if (!name.empty() && name.back() == '.') name.remove_suffix(1);

    size_t wire_len = 1;
    while (!name.empty()) {
        const size_t dot = name.find('.');
        const std::string_view label = name.substr(0, dot);
        if (label.empty()) {
            throw EncodeLimitError("empty label in domain name");
        }
        if (label.size() > MAX_LABEL_SIZE) {
            throw EncodeLimitError("label '" + std::string{label} +
                                   "' exceeds 63 bytes");
        }
        wire_len += 1 + label.size();
        if (wire_len > MAX_NAME_SIZE) {
            throw EncodeLimitError("domain name exceeds 255 bytes");
        }
        core::ser_write_u8(s, static_cast<uint8_t>(label.size()));
        core::ser_write_bytes(s, core::as_bytes(label));
        name = dot == std::string_view::npos ? std::string_view{}
                                             : name.substr(dot + 1);
    }
    core::ser_write_u8(s, 0);
}

std::vector<uint8_t> encode_name(std::string_view name) {
    core::DataStream s;
    write_name(s, name);
    return s.release();
}

/// Name stored uncompressed at the start of @p rdata (after @p skip bytes).
std::string rdata_name(std::span<const uint8_t> rdata, size_t skip) {
    core::SpanReader reader{rdata};
    reader.skip(skip);
    return read_name(reader);
}

bool rdata_has_name(uint16_t type) {
    switch (static_cast<RecordType>(type)) {
    case RecordType::NS:
    case RecordType::CNAME:
    case RecordType::PTR:
    case RecordType::MX:
        return true;
    default:
        return false;
    }
}

ResourceRecord read_record(core::SpanReader& reader) {
    ResourceRecord rr;
    rr.name  = read_name(reader);
    rr.type  = core::ser_read_u16be(reader);
    rr.klass = core::ser_read_u16be(reader);
    rr.ttl   = core::ser_read_u32be(reader);
    const uint16_t rdlength = core::ser_read_u16be(reader);
    if (rdlength > reader.remaining()) {
        throw std::runtime_error("RDATA runs past end of message");
    }

    const size_t start = reader.tell();
    if (!rdata_has_name(rr.type)) {
        rr.rdata = core::ser_read_vector(reader, rdlength);
        return rr;
    }

    // Rewrite the embedded name in uncompressed form.
    core::DataStream out;
    if (static_cast<RecordType>(rr.type) == RecordType::MX) {
        core::ser_write_u16be(out, core::ser_read_u16be(reader));
    }
    write_name(out, read_name(reader));
    if (reader.tell() != start + rdlength) {
        throw std::runtime_error("RDATA length does not match its name");
    }
    rr.rdata = out.release();
    return rr;
}

template <typename Stream>
void write_record(Stream& s, const ResourceRecord& rr) {
    if (rr.rdata.size() > 0xFFFF) {
        throw EncodeLimitError("RDATA exceeds 65535 bytes");
    }
    write_name(s, rr.name);
    core::ser_write_u16be(s, rr.type);
    core::ser_write_u16be(s, rr.klass);
    core::ser_write_u32be(s, rr.ttl);
    core::ser_write_u16be(s, static_cast<uint16_t>(rr.rdata.size()));
    core::ser_write_bytes(s, rr.rdata);
}

uint16_t section_count(size_t n) {
    if (n > 0xFFFF) {
        throw EncodeLimitError("section holds more than 65535 entries");
    }
    return static_cast<uint16_t>(n);
}

std::string quote(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace

// ===========================================================================
// Record types
// ===========================================================================

std::string record_type_name(uint16_t type) {
    switch (static_cast<RecordType>(type)) {
    case RecordType::A:     return "A";
    case RecordType::NS:    return "NS";
    case RecordType::CNAME: return "CNAME";
    case RecordType::SOA:   return "SOA";
    case RecordType::PTR:   return "PTR";
    case RecordType::MX:    return "MX";
    case RecordType::TXT:   return "TXT";
    case RecordType::AAAA:  return "AAAA";
    case RecordType::SRV:   return "SRV";
    case RecordType::SVCB:  return "SVCB";
    case RecordType::HTTPS: return "HTTPS";
    }
    return "TYPE" + std::to_string(type);
}

// ===========================================================================
// Header
// ===========================================================================

uint16_t Header::flags() const noexcept {
    uint16_t f = 0;
    if (qr) f |= 0x8000;
    f |= static_cast<uint16_t>((opcode & 0x0F) << 11);
    if (aa) f |= 0x0400;
    if (tc) f |= 0x0200;
    if (rd) f |= 0x0100;
    if (ra) f |= 0x0080;
    f |= static_cast<uint16_t>(rcode & 0x0F);
    return f;
}

Header Header::from_flags(uint16_t id, uint16_t flags) noexcept {
    Header h;
    h.id     = id;
    h.qr     = (flags & 0x8000) != 0;
    h.opcode = static_cast<uint8_t>((flags >> 11) & 0x0F);
    h.aa     = (flags & 0x0400) != 0;
    h.tc     = (flags & 0x0200) != 0;
    h.rd     = (flags & 0x0100) != 0;
    h.ra     = (flags & 0x0080) != 0;
    h.rcode  = static_cast<uint8_t>(flags & 0x0F);
    return h;
}

// ===========================================================================
// ResourceRecord
// ===========================================================================

ResourceRecord ResourceRecord::a(std::string name,
                                 std::array<uint8_t, 4> addr, uint32_t ttl) {
    ResourceRecord rr;
    rr.name  = std::move(name);
    rr.type  = static_cast<uint16_t>(RecordType::A);
    rr.ttl   = ttl;
    rr.rdata.assign(addr.begin(), addr.end());
    return rr;
}

ResourceRecord ResourceRecord::aaaa(std::string name,
                                    std::array<uint8_t, 16> addr,
                                    uint32_t ttl) {
    ResourceRecord rr;
    rr.name  = std::move(name);
    rr.type  = static_cast<uint16_t>(RecordType::AAAA);
    rr.ttl   = ttl;
    rr.rdata.assign(addr.begin(), addr.end());
    return rr;
}

ResourceRecord ResourceRecord::cname(std::string name,
                                     std::string_view target, uint32_t ttl) {
    ResourceRecord rr;
    rr.name  = std::move(name);
    rr.type  = static_cast<uint16_t>(RecordType::CNAME);
    rr.ttl   = ttl;
    rr.rdata = encode_name(target);
    return rr;
}

ResourceRecord ResourceRecord::txt(std::string name, std::string_view text,
                                   uint32_t ttl) {
    ResourceRecord rr;
    rr.name = std::move(name);
    rr.type = static_cast<uint16_t>(RecordType::TXT);
    rr.ttl  = ttl;

    // An empty TXT record is one zero-length character-string.
    do {
        const size_t n = std::min(text.size(), MAX_STRING_SIZE);
        rr.rdata.push_back(static_cast<uint8_t>(n));
        rr.rdata.insert(rr.rdata.end(), text.begin(), text.begin() + n);
        text.remove_prefix(n);
    } while (!text.empty());
    return rr;
}

std::optional<std::string> ResourceRecord::txt_data() const {
    if (type != static_cast<uint16_t>(RecordType::TXT)) return std::nullopt;

    std::string out;
    size_t pos = 0;
    while (pos < rdata.size()) {
        const size_t n = rdata[pos];
        if (pos + 1 + n > rdata.size()) return std::nullopt;
        out.append(reinterpret_cast<const char*>(rdata.data() + pos + 1), n);
        pos += 1 + n;
    }
    return out;
}

std::string ResourceRecord::to_string() const {
    std::string out = (name.empty() ? "." : name) + " " +
                      std::to_string(ttl) + " " +
                      (klass == CLASS_IN ? "IN" : "CLASS" +
                                                      std::to_string(klass)) +
                      " " + record_type_name(type) + " ";

    try {
        switch (static_cast<RecordType>(type)) {
        case RecordType::A:
            if (rdata.size() == 4) {
                return out + std::to_string(rdata[0]) + "." +
                       std::to_string(rdata[1]) + "." +
                       std::to_string(rdata[2]) + "." +
                       std::to_string(rdata[3]);
            }
            break;
        case RecordType::AAAA:
            if (rdata.size() == 16) {
                std::string addr;
                for (size_t i = 0; i < 16; i += 2) {
                    if (i > 0) addr.push_back(':');
                    addr += core::to_hex(
                        std::span<const uint8_t>(rdata.data() + i, 2));
                }
                return out + addr;
            }
            break;
        case RecordType::NS:
        case RecordType::CNAME:
        case RecordType::PTR:
            return out + rdata_name(rdata, 0) + ".";
        case RecordType::MX:
            if (rdata.size() >= 3) {
                const unsigned pref = (static_cast<unsigned>(rdata[0]) << 8) |
                                      rdata[1];
                return out + std::to_string(pref) + " " +
                       rdata_name(rdata, 2) + ".";
            }
            break;
        case RecordType::TXT:
            if (auto text = txt_data()) return out + quote(*text);
            break;
        default:
            break;
        }
    } catch (const std::exception& e) {
        LOG_DEBUG(core::LogCategory::DNS,
                  std::string("unprintable RDATA: ") + e.what());
    }

    // RFC 3597 generic presentation.
    return out + "\\# " + std::to_string(rdata.size()) +
           (rdata.empty() ? "" : " " + core::to_hex(rdata));
}

// ===========================================================================
// Packet
// ===========================================================================

Packet Packet::new_reply(uint16_t id) {
    Packet p;
    p.header.id = id;
    p.header.qr = true;
    return p;
}

core::Result<Packet> Packet::decode(std::span<const uint8_t> data) {
    if (data.size() < HEADER_SIZE) {
        return core::make_error(core::ErrorCode::DNS_MALFORMED,
            "DNS message shorter than its header: " +
            std::to_string(data.size()) + " bytes");
    }

    try {
        core::SpanReader reader{data};
        Packet p;
        const uint16_t id    = core::ser_read_u16be(reader);
        const uint16_t flags = core::ser_read_u16be(reader);
        p.header = Header::from_flags(id, flags);

        const uint16_t qdcount = core::ser_read_u16be(reader);
        const uint16_t ancount = core::ser_read_u16be(reader);
        const uint16_t nscount = core::ser_read_u16be(reader);
        const uint16_t arcount = core::ser_read_u16be(reader);

        for (uint16_t i = 0; i < qdcount; ++i) {
            Question q;
            q.name  = read_name(reader);
            q.type  = core::ser_read_u16be(reader);
            q.klass = core::ser_read_u16be(reader);
            p.questions.push_back(std::move(q));
        }
        for (uint16_t i = 0; i < ancount; ++i) {
            p.answers.push_back(read_record(reader));
        }
        for (uint16_t i = 0; i < nscount; ++i) {
            p.authorities.push_back(read_record(reader));
        }
        for (uint16_t i = 0; i < arcount; ++i) {
            p.additionals.push_back(read_record(reader));
        }

        if (!reader.eof()) {
            return core::make_error(core::ErrorCode::DNS_MALFORMED,
                std::to_string(reader.remaining()) +
                " trailing bytes after DNS message");
        }
        return p;
    } catch (const std::exception& e) {
        return core::make_error(core::ErrorCode::DNS_MALFORMED,
            std::string("failed to decode DNS message: ") + e.what());
    }
}

core::Result<std::vector<uint8_t>> Packet::encode() const {
    try {
        core::DataStream s;
        core::ser_write_u16be(s, header.id);
        core::ser_write_u16be(s, header.flags());
        core::ser_write_u16be(s, section_count(questions.size()));
        core::ser_write_u16be(s, section_count(answers.size()));
        core::ser_write_u16be(s, section_count(authorities.size()));
        core::ser_write_u16be(s, section_count(additionals.size()));

        for (const auto& q : questions) {
            write_name(s, q.name);
            core::ser_write_u16be(s, q.type);
            core::ser_write_u16be(s, q.klass);
        }
        for (const auto& rr : answers)     write_record(s, rr);
        for (const auto& rr : authorities) write_record(s, rr);
        for (const auto& rr : additionals) write_record(s, rr);

        return s.release();
    } catch (const EncodeLimitError& e) {
        return core::make_error(core::ErrorCode::DNS_TOO_LARGE, e.what());
    }
}

std::optional<uint32_t> Packet::min_answer_ttl() const {
    std::optional<uint32_t> min_ttl;
    for (const auto& rr : answers) {
        if (!min_ttl || rr.ttl < *min_ttl) min_ttl = rr.ttl;
    }
    return min_ttl;
}

}  // namespace dns
