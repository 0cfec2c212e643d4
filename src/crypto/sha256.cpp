// SEEDORDER - SHA256 Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// SHA-256 via OpenSSL EVP. The context is created once per hasher and
// re-initialized on Reset, so repeated hashing does not reallocate.

#include "seedorder/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace seedorder {

// ============================================================================
// SHA256 Implementation
// ============================================================================

struct SHA256::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("SHA256: EVP_MD_CTX_new failed");
        }
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }

    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("SHA256: EVP_DigestInit_ex failed");
        }
    }
};

SHA256::SHA256() : impl_(std::make_unique<Impl>()) {
    impl_->Init();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Reset() {
    impl_->Init();
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("SHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("SHA256: EVP_DigestFinal_ex failed");
    }
    impl_->Init();
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    Hash256 result;
    SHA256().Write(data, len).Finalize(result.data());
    return result;
}

Hash256 DoubleSHA256(const Byte* data, size_t len) {
    SHA256 hasher;
    Hash256 first;
    hasher.Write(data, len).Finalize(first.data());

    Hash256 result;
    hasher.Write(first.data(), first.size()).Finalize(result.data());
    return result;
}

} // namespace seedorder
