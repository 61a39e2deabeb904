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

#include "core/error.h"
#include "core/types.h"

typedef struct evp_pkey_st EVP_PKEY;

namespace crypto {

inline constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
inline constexpr size_t ED25519_SECRET_KEY_SIZE = 32;
inline constexpr size_t ED25519_SIGNATURE_SIZE  = 64;

/// Raw 64-byte Ed25519 signature (R || S).
using Signature = core::Blob<ED25519_SIGNATURE_SIZE>;

/// Ed25519 verification key.  Immutable value type.
class PublicKey {
public:
    PublicKey() = default;

    /// Accept exactly 32 bytes that OpenSSL recognises as an Ed25519 key.
    static core::Result<PublicKey> from_bytes(std::span<const uint8_t> bytes);

    /// Parse the 52-character z-base-32 text form.
    static core::Result<PublicKey> from_zbase32(std::string_view text);

    /// Verify an Ed25519 signature over @p message.
    /// Fails with CRYPTO_INVALID_SIGNATURE on mismatch.
    [[nodiscard]] core::Result<void> verify(
        std::span<const uint8_t> message, const Signature& sig) const;

    [[nodiscard]] const std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>&
    bytes() const noexcept { return bytes_; }

    [[nodiscard]] std::string to_zbase32() const;
    [[nodiscard]] std::string to_hex() const;

    auto operator<=>(const PublicKey&) const = default;
    bool operator==(const PublicKey&) const = default;

private:
    std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE> bytes_{};
};

/// Ed25519 signing key using the OpenSSL 3.0+ EVP API.
/// Owns a 32-byte secret seed and the EVP_PKEY built from it.
class Keypair {
public:
    Keypair() = default;
    ~Keypair();

    Keypair(const Keypair&) = delete;
    Keypair& operator=(const Keypair&) = delete;

    Keypair(Keypair&& other) noexcept;
    Keypair& operator=(Keypair&& other) noexcept;

    /// Generate a new key from a random seed.
    /// Throws std::runtime_error if OpenSSL cannot build the key.
    static Keypair generate();

    /// Construct from an existing 32-byte seed.
    static core::Result<Keypair> from_secret(
        std::span<const uint8_t, ED25519_SECRET_KEY_SIZE> secret);

    [[nodiscard]] bool is_valid() const noexcept { return pkey_ != nullptr; }

    /// Raw 32-byte seed.
    [[nodiscard]] const std::array<uint8_t, ED25519_SECRET_KEY_SIZE>&
    secret() const noexcept { return secret_; }

    [[nodiscard]] const PublicKey& public_key() const noexcept {
        return public_key_;
    }

    /// Deterministic Ed25519 signature over @p message.
    /// Throws std::runtime_error when called on an empty key.
    [[nodiscard]] Signature sign(std::span<const uint8_t> message) const;

private:
    std::array<uint8_t, ED25519_SECRET_KEY_SIZE> secret_{};
    PublicKey public_key_;
    EVP_PKEY* pkey_ = nullptr;
};

}  // namespace crypto

template <>
struct std::hash<crypto::PublicKey> {
    std::size_t operator()(const crypto::PublicKey& k) const noexcept {
        std::size_t h = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            h = (h << 8) | k.bytes()[i];
        }
        return h;
    }
};
