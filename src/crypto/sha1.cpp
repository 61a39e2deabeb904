// Copyright (c) 2024-2026 The Pkarr Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/sha1.h"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace crypto {

namespace {

struct EVP_MD_Del { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };

} // anonymous namespace

struct Sha1Hasher::Impl {
    std::unique_ptr<EVP_MD_CTX, EVP_MD_Del> ctx{EVP_MD_CTX_new()};
    bool finalized = false;
};

Sha1Hasher::Sha1Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx) {
        throw std::runtime_error("sha1: EVP_MD_CTX_new() allocation failed");
    }
    if (EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("sha1: EVP_DigestInit_ex() failed");
    }
}

Sha1Hasher::~Sha1Hasher() = default;

Sha1Hasher& Sha1Hasher::write(std::span<const uint8_t> data) {
    if (impl_->finalized) {
        throw std::runtime_error("sha1: write() after finalize()");
    }
    if (!data.empty() &&
        EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("sha1: EVP_DigestUpdate() failed");
    }
    return *this;
}

core::uint160 Sha1Hasher::finalize() {
    if (impl_->finalized) {
        throw std::runtime_error("sha1: finalize() called twice");
    }
    core::uint160 out;
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &len) != 1 ||
        len != out.size()) {
        throw std::runtime_error("sha1: EVP_DigestFinal_ex() failed");
    }
    impl_->finalized = true;
    return out;
}

core::uint160 sha1(std::span<const uint8_t> data) {
    return Sha1Hasher{}.write(data).finalize();
}

}  // namespace crypto
