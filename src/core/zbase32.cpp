// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "zbase32.h"

#include <array>

namespace core {

namespace {

// Reverse lookup: ASCII value -> quintet (0-31), or -1 if invalid.
constexpr std::array<int8_t, 256> make_zbase32_map() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 32; ++i) {
        auto c = static_cast<uint8_t>(ZBASE32_ALPHABET[i]);
        table[c] = static_cast<int8_t>(i);
        if (c >= 'a' && c <= 'z') {
            table[c - 'a' + 'A'] = static_cast<int8_t>(i);
        }
    }
    return table;
}

constexpr auto ZBASE32_MAP = make_zbase32_map();

} // anonymous namespace

std::string zbase32_encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(ZBASE32_ALPHABET[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) {
        out.push_back(ZBASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

std::optional<std::vector<uint8_t>> zbase32_decode(std::string_view str) {
    std::vector<uint8_t> out;
    out.reserve(str.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char ch : str) {
        int8_t v = ZBASE32_MAP[static_cast<uint8_t>(ch)];
        if (v < 0) return std::nullopt;
        buffer = (buffer << 5) | static_cast<uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>(buffer >> bits));
        }
    }
    return out;
}

}  // namespace core
