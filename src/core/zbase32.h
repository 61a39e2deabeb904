#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// z-base-32 alphabet (human-oriented base-32, see
// http://philzimmermann.com/docs/human-oriented-base-32-encoding.txt).
inline constexpr char ZBASE32_ALPHABET[] = "ybndrfg8ejkmcpqxot1uwisza345h769";

/// Encode raw bytes as z-base-32.  Bits are consumed most significant
/// first; the final quintet is zero-padded.  No padding characters are
/// emitted, so 32 bytes encode to 52 characters.
std::string zbase32_encode(std::span<const uint8_t> data);

/// Decode a z-base-32 string.  Upper-case input is accepted.  Trailing
/// bits that do not fill a whole byte are discarded.
/// Returns std::nullopt if any character is outside the alphabet.
std::optional<std::vector<uint8_t>> zbase32_decode(std::string_view str);

}  // namespace core
