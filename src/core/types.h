#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace core {

// ---------------------------------------------------------------------------
// Blob<N> -- fixed-size opaque byte string
// ---------------------------------------------------------------------------
// Bytes are kept in wire order.  Hex display and ordering are both plain
// lexicographic over that order, which for DHT identifiers is the same as
// comparing them as big-endian integers.
// ---------------------------------------------------------------------------
template <std::size_t N>
class Blob {
public:
    static constexpr std::size_t SIZE = N;

    /// Default: zero-initialized.
    constexpr Blob() noexcept : bytes_{} {}

    static Blob from_bytes(std::span<const uint8_t, N> bytes) noexcept;

    /// Parse exactly 2*N hex characters.  Throws std::invalid_argument on
    /// malformed input.
    static Blob from_hex(std::string_view hex);

    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]]       uint8_t* data()       noexcept { return bytes_.data(); }

    [[nodiscard]] const std::array<uint8_t, N>& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] std::span<const uint8_t, N> span() const noexcept {
        return std::span<const uint8_t, N>(bytes_);
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return N; }

    [[nodiscard]] bool is_zero() const noexcept;

    [[nodiscard]] std::strong_ordering operator<=>(const Blob& other) const noexcept;
    [[nodiscard]] bool operator==(const Blob& other) const noexcept;

protected:
    std::array<uint8_t, N> bytes_;
};

// 160-bit DHT identifiers (node ids, BEP44 targets).
using uint160 = Blob<20>;
// 256-bit keys.
using uint256 = Blob<32>;

}  // namespace core

// ---------------------------------------------------------------------------
// std::hash specialization
// ---------------------------------------------------------------------------
template <std::size_t N>
struct std::hash<core::Blob<N>> {
    std::size_t operator()(const core::Blob<N>& v) const noexcept {
        // Inputs are hash outputs or public keys, so the leading bytes are
        // already uniformly distributed.
        std::size_t h = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < N; ++i) {
            h = (h << 8) | v.bytes()[i];
        }
        return h;
    }
};
