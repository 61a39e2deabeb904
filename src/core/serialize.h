#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/stream.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// ===================================================================
// Fixed-width integers, network byte order
// ===================================================================
//
// Relay payloads and DNS messages both carry big-endian integers, so
// unlike a little-endian wire format every helper here writes the most
// significant byte first.
// ===================================================================

template <typename Stream>
inline void ser_write_u8(Stream& s, uint8_t v) {
    s.write(std::span<const uint8_t>(&v, 1));
}

template <typename Stream>
inline void ser_write_u16be(Stream& s, uint16_t v) {
    uint8_t buf[2];
    buf[0] = static_cast<uint8_t>(v >> 8);
    buf[1] = static_cast<uint8_t>(v);
    s.write(std::span<const uint8_t>(buf, 2));
}

template <typename Stream>
inline void ser_write_u32be(Stream& s, uint32_t v) {
    uint8_t buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = static_cast<uint8_t>(v >> (24 - 8 * i));
    }
    s.write(std::span<const uint8_t>(buf, 4));
}

template <typename Stream>
inline void ser_write_u64be(Stream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>(v >> (56 - 8 * i));
    }
    s.write(std::span<const uint8_t>(buf, 8));
}

template <typename Stream>
inline void ser_write_bytes(Stream& s, std::span<const uint8_t> data) {
    if (!data.empty()) {
        s.write(data);
    }
}

template <typename Stream>
inline uint8_t ser_read_u8(Stream& s) {
    uint8_t v = 0;
    s.read(std::span<uint8_t>(&v, 1));
    return v;
}

template <typename Stream>
inline uint16_t ser_read_u16be(Stream& s) {
    uint8_t buf[2];
    s.read(std::span<uint8_t>(buf, 2));
    return static_cast<uint16_t>((static_cast<uint16_t>(buf[0]) << 8) |
                                 buf[1]);
}

template <typename Stream>
inline uint32_t ser_read_u32be(Stream& s) {
    uint8_t buf[4];
    s.read(std::span<uint8_t>(buf, 4));
    uint32_t v = 0;
    for (uint8_t b : buf) v = (v << 8) | b;
    return v;
}

template <typename Stream>
inline uint64_t ser_read_u64be(Stream& s) {
    uint8_t buf[8];
    s.read(std::span<uint8_t>(buf, 8));
    uint64_t v = 0;
    for (uint8_t b : buf) v = (v << 8) | b;
    return v;
}

template <typename Stream>
inline void ser_read_bytes(Stream& s, std::span<uint8_t> buf) {
    if (!buf.empty()) {
        s.read(buf);
    }
}

template <typename Stream>
inline std::vector<uint8_t> ser_read_vector(Stream& s, size_t n) {
    std::vector<uint8_t> out(n);
    ser_read_bytes(s, out);
    return out;
}

template <typename Stream, size_t N>
inline std::array<uint8_t, N> ser_read_array(Stream& s) {
    std::array<uint8_t, N> out{};
    s.read(std::span<uint8_t>(out.data(), N));
    return out;
}

// ===================================================================
// Span helpers
// ===================================================================

inline uint64_t read_u64be(std::span<const uint8_t, 8> bytes) {
    uint64_t v = 0;
    for (uint8_t b : bytes) v = (v << 8) | b;
    return v;
}

inline std::span<const uint8_t> as_bytes(std::string_view sv) {
    return std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(sv.data()), sv.size());
}

}  // namespace core
