// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/ed25519.h"

#include "core/hex.h"
#include "core/random.h"
#include "core/zbase32.h"

#include <cstring>
#include <memory>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace crypto {

// ---------------------------------------------------------------------------
// RAII helpers for OpenSSL objects
// ---------------------------------------------------------------------------
namespace {

struct EVP_KEY_Del { void operator()(EVP_PKEY* p)   const { EVP_PKEY_free(p); } };
struct EVP_MD_Del  { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };

using EVP_KEY_ptr = std::unique_ptr<EVP_PKEY, EVP_KEY_Del>;
using EVP_MD_ptr  = std::unique_ptr<EVP_MD_CTX, EVP_MD_Del>;

EVP_KEY_ptr build_public_pkey(const uint8_t* pub) {
    return EVP_KEY_ptr{EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr, pub, ED25519_PUBLIC_KEY_SIZE)};
}

}  // namespace

// ---------------------------------------------------------------------------
// PublicKey
// ---------------------------------------------------------------------------

core::Result<PublicKey> PublicKey::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != ED25519_PUBLIC_KEY_SIZE) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
            "public key must be 32 bytes, got " +
            std::to_string(bytes.size()));
    }
    if (!build_public_pkey(bytes.data())) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
            "OpenSSL rejected the Ed25519 public key");
    }
    PublicKey key;
    std::memcpy(key.bytes_.data(), bytes.data(), ED25519_PUBLIC_KEY_SIZE);
    return key;
}

core::Result<PublicKey> PublicKey::from_zbase32(std::string_view text) {
    auto decoded = core::zbase32_decode(text);
    if (!decoded) {
        return core::make_error(core::ErrorCode::PARSE_BAD_FORMAT,
            "invalid z-base-32 public key '" + std::string{text} + "'");
    }
    return from_bytes(*decoded);
}

core::Result<void> PublicKey::verify(std::span<const uint8_t> message,
                                     const Signature& sig) const {
    EVP_KEY_ptr pkey = build_public_pkey(bytes_.data());
    if (!pkey) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
            "cannot load Ed25519 public key " + to_zbase32());
    }

    EVP_MD_ptr md_ctx{EVP_MD_CTX_new()};
    if (!md_ctx ||
        EVP_DigestVerifyInit(md_ctx.get(), nullptr, nullptr, nullptr,
                             pkey.get()) <= 0) {
        return core::make_error(core::ErrorCode::CRYPTO_ERROR,
            "EVP_DigestVerifyInit failed");
    }

    // Ed25519 is a one-shot scheme: the message goes through
    // EVP_DigestVerify, never through the update/final pair.
    if (EVP_DigestVerify(md_ctx.get(), sig.data(), sig.size(),
                         message.data(), message.size()) != 1) {
        return core::make_error(core::ErrorCode::CRYPTO_INVALID_SIGNATURE,
            "signature does not verify under " + to_zbase32());
    }
    return core::make_ok();
}

std::string PublicKey::to_zbase32() const {
    return core::zbase32_encode(bytes_);
}

std::string PublicKey::to_hex() const {
    return core::to_hex(bytes_);
}

// ---------------------------------------------------------------------------
// Keypair -- lifecycle
// ---------------------------------------------------------------------------

Keypair::~Keypair() {
    if (pkey_) EVP_PKEY_free(pkey_);
    OPENSSL_cleanse(secret_.data(), secret_.size());
}

Keypair::Keypair(Keypair&& other) noexcept
    : secret_(other.secret_),
      public_key_(other.public_key_),
      pkey_(other.pkey_) {
    other.pkey_ = nullptr;
    OPENSSL_cleanse(other.secret_.data(), other.secret_.size());
}

Keypair& Keypair::operator=(Keypair&& other) noexcept {
    if (this != &other) {
        if (pkey_) EVP_PKEY_free(pkey_);
        OPENSSL_cleanse(secret_.data(), secret_.size());

        secret_ = other.secret_;
        public_key_ = other.public_key_;
        pkey_ = other.pkey_;

        other.pkey_ = nullptr;
        OPENSSL_cleanse(other.secret_.data(), other.secret_.size());
    }
    return *this;
}

// ---------------------------------------------------------------------------
// Keypair -- construction
// ---------------------------------------------------------------------------

Keypair Keypair::generate() {
    std::array<uint8_t, ED25519_SECRET_KEY_SIZE> seed{};
    core::get_random_bytes(seed);
    auto result = from_secret(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    if (!result.ok()) {
        throw std::runtime_error(
            "Keypair::generate: " + result.error().message());
    }
    return std::move(result).value();
}

core::Result<Keypair> Keypair::from_secret(
    std::span<const uint8_t, ED25519_SECRET_KEY_SIZE> secret) {
    EVP_PKEY* raw = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr, secret.data(), secret.size());
    if (!raw) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
            "failed to build Ed25519 EVP_PKEY from secret");
    }

    Keypair key;
    key.pkey_ = raw;
    std::memcpy(key.secret_.data(), secret.data(), secret.size());

    std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE> pub{};
    size_t pub_len = pub.size();
    if (EVP_PKEY_get_raw_public_key(raw, pub.data(), &pub_len) != 1 ||
        pub_len != pub.size()) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
            "failed to derive Ed25519 public key");
    }
    PKARR_TRY_ASSIGN(public_key, PublicKey::from_bytes(pub));
    key.public_key_ = public_key;
    return core::Result<Keypair>{std::move(key)};
}

// ---------------------------------------------------------------------------
// Keypair -- signing
// ---------------------------------------------------------------------------

Signature Keypair::sign(std::span<const uint8_t> message) const {
    if (!pkey_) {
        throw std::runtime_error("Keypair::sign: no key loaded");
    }

    EVP_MD_ptr md_ctx{EVP_MD_CTX_new()};
    if (!md_ctx ||
        EVP_DigestSignInit(md_ctx.get(), nullptr, nullptr, nullptr,
                           pkey_) <= 0) {
        throw std::runtime_error("Keypair::sign: EVP_DigestSignInit failed");
    }

    Signature sig;
    size_t sig_len = sig.size();
    if (EVP_DigestSign(md_ctx.get(), sig.data(), &sig_len,
                       message.data(), message.size()) <= 0 ||
        sig_len != sig.size()) {
        throw std::runtime_error("Keypair::sign: EVP_DigestSign failed");
    }
    return sig;
}

}  // namespace crypto
