#pragma once
// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

// ---------------------------------------------------------------------------
// SHA-1 wrapper around the OpenSSL 3.0+ EVP API.
//
// SHA-1 is used only to derive 160-bit DHT keys, never as a security
// primitive: BEP44 defines the mutable-item target as SHA1(k || salt).
// ---------------------------------------------------------------------------

#include "core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace crypto {

/// One-shot SHA-1 of a byte span.
[[nodiscard]] core::uint160 sha1(std::span<const uint8_t> data);

/// Incremental SHA-1.  Feed data with write(), obtain the digest with
/// finalize().  Throws std::runtime_error if OpenSSL fails.
class Sha1Hasher {
public:
    Sha1Hasher();
    ~Sha1Hasher();

    Sha1Hasher(const Sha1Hasher&) = delete;
    Sha1Hasher& operator=(const Sha1Hasher&) = delete;

    Sha1Hasher& write(std::span<const uint8_t> data);

    /// Produce the 20-byte digest.  The hasher must not be reused.
    [[nodiscard]] core::uint160 finalize();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace crypto
