#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace core {

// Encode a byte span to a lowercase hexadecimal string.
std::string to_hex(std::span<const uint8_t> data);

// Decode a hexadecimal string (either case) to bytes. Returns nullopt if
// the input has odd length or contains non-hex characters.
std::optional<std::vector<uint8_t>> from_hex(std::string_view hex);

// Check whether a string is a valid hexadecimal encoding.
bool is_hex(std::string_view str);

}  // namespace core
