// SEEDORDER - RIPEMD160 Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// RIPEMD-160 via OpenSSL EVP (served by the default provider since 3.0.7).

#include "seedorder/crypto/ripemd160.h"
#include "seedorder/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace seedorder {

// ============================================================================
// RIPEMD160 Implementation
// ============================================================================

struct RIPEMD160::Impl {
    EVP_MD_CTX* ctx{nullptr};

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("RIPEMD160: EVP_MD_CTX_new failed");
        }
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }

    void Init() {
        if (EVP_DigestInit_ex(ctx, EVP_ripemd160(), nullptr) != 1) {
            throw std::runtime_error("RIPEMD160: digest not available in this OpenSSL build");
        }
    }
};

RIPEMD160::RIPEMD160() : impl_(std::make_unique<Impl>()) {
    impl_->Init();
}

RIPEMD160::~RIPEMD160() = default;

RIPEMD160& RIPEMD160::Reset() {
    impl_->Init();
    return *this;
}

RIPEMD160& RIPEMD160::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw std::runtime_error("RIPEMD160: EVP_DigestUpdate failed");
    }
    return *this;
}

void RIPEMD160::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("RIPEMD160: EVP_DigestFinal_ex failed");
    }
    impl_->Init();
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash160 RIPEMD160Hash(const Byte* data, size_t len) {
    Hash160 result;
    RIPEMD160().Write(data, len).Finalize(result.data());
    return result;
}

Hash160 Hash160FromData(const Byte* data, size_t len) {
    Hash256 sha = SHA256Hash(data, len);
    return RIPEMD160Hash(sha.data(), sha.size());
}

} // namespace seedorder
