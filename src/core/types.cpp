// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/types.h"

#include <algorithm>
#include <stdexcept>

namespace core {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

constexpr int hex_digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

// ===========================================================================
// Blob<N> -- template method definitions
// ===========================================================================
// Explicit instantiations at the bottom of this file cover every width the
// project uses, so the definitions can stay out of the header.

template <std::size_t N>
Blob<N> Blob<N>::from_bytes(std::span<const uint8_t, N> bytes) noexcept {
    Blob<N> result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.begin());
    return result;
}

template <std::size_t N>
Blob<N> Blob<N>::from_hex(std::string_view hex) {
    if (hex.size() != N * 2) {
        throw std::invalid_argument(
            "Blob::from_hex: expected " + std::to_string(N * 2) +
            " hex chars, got " + std::to_string(hex.size()));
    }

    Blob<N> result;
    for (std::size_t i = 0; i < N; ++i) {
        int hi = hex_digit_value(hex[2 * i]);
        int lo = hex_digit_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument(
                "Blob::from_hex: invalid hex character");
        }
        result.bytes_[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return result;
}

template <std::size_t N>
std::string Blob<N>::to_hex() const {
    std::string out;
    out.reserve(N * 2);
    for (uint8_t byte : bytes_) {
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

template <std::size_t N>
bool Blob<N>::is_zero() const noexcept {
    for (auto b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

template <std::size_t N>
std::strong_ordering Blob<N>::operator<=>(const Blob& other) const noexcept {
    for (std::size_t i = 0; i < N; ++i) {
        if (bytes_[i] != other.bytes_[i]) {
            return bytes_[i] < other.bytes_[i]
                       ? std::strong_ordering::less
                       : std::strong_ordering::greater;
        }
    }
    return std::strong_ordering::equal;
}

template <std::size_t N>
bool Blob<N>::operator==(const Blob& other) const noexcept {
    return bytes_ == other.bytes_;
}

template class Blob<20>;
template class Blob<32>;
template class Blob<64>;

}  // namespace core
