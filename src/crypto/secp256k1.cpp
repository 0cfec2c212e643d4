// SEEDORDER - secp256k1 Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Each thread owns one curve group and BN_CTX, created on first use.
// Search workers derive keys concurrently without sharing OpenSSL state.

#include "seedorder/crypto/secp256k1.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <stdexcept>

namespace seedorder {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

const std::array<uint8_t, SCALAR_SIZE> CURVE_ORDER = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

namespace {

// ============================================================================
// RAII Helpers
// ============================================================================

struct BigNum {
    BIGNUM* bn;

    BigNum() : bn(BN_new()) {
        if (!bn) throw std::runtime_error("secp256k1: BN_new failed");
    }
    explicit BigNum(const uint8_t* data, size_t len = SCALAR_SIZE)
        : bn(BN_bin2bn(data, static_cast<int>(len), nullptr)) {
        if (!bn) throw std::runtime_error("secp256k1: BN_bin2bn failed");
    }
    ~BigNum() { BN_clear_free(bn); }

    BigNum(const BigNum&) = delete;
    BigNum& operator=(const BigNum&) = delete;
};

struct Point {
    EC_POINT* p;

    explicit Point(const EC_GROUP* group) : p(EC_POINT_new(group)) {
        if (!p) throw std::runtime_error("secp256k1: EC_POINT_new failed");
    }
    ~Point() { EC_POINT_free(p); }

    Point(const Point&) = delete;
    Point& operator=(const Point&) = delete;
};

/// Per-thread curve context
class Context {
public:
    static Context& ThreadLocal() {
        thread_local Context ctx;
        return ctx;
    }

    const EC_GROUP* Group() const { return group_; }
    BN_CTX* BnCtx() const { return bnCtx_; }
    const BIGNUM* Order() const { return order_.bn; }

    ~Context() {
        BN_CTX_free(bnCtx_);
        EC_GROUP_free(group_);
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

private:
    Context()
        : order_(CURVE_ORDER.data())
        , group_(EC_GROUP_new_by_curve_name(NID_secp256k1))
        , bnCtx_(BN_CTX_new()) {
        if (!group_ || !bnCtx_) {
            BN_CTX_free(bnCtx_);
            EC_GROUP_free(group_);
            throw std::runtime_error("secp256k1: failed to create curve context");
        }
    }

    BigNum order_;
    EC_GROUP* group_;
    BN_CTX* bnCtx_;
};

/// Scalar in [1, n-1]
bool InRange(const BIGNUM* k, const BIGNUM* order) {
    return !BN_is_zero(k) && BN_cmp(k, order) < 0;
}

} // namespace

// ============================================================================
// Operations
// ============================================================================

bool IsValidPrivateKey(const uint8_t* key) {
    Context& ctx = Context::ThreadLocal();
    BigNum k(key);
    return InRange(k.bn, ctx.Order());
}

bool ComputePublicKey(const uint8_t* key, std::array<uint8_t, COMPRESSED_SIZE>& out) {
    Context& ctx = Context::ThreadLocal();
    BigNum k(key);
    if (!InRange(k.bn, ctx.Order())) {
        return false;
    }

    Point pub(ctx.Group());
    if (!EC_POINT_mul(ctx.Group(), pub.p, k.bn, nullptr, nullptr, ctx.BnCtx())) {
        throw std::runtime_error("secp256k1: EC_POINT_mul failed");
    }

    size_t len = EC_POINT_point2oct(ctx.Group(), pub.p, POINT_CONVERSION_COMPRESSED,
                                    out.data(), out.size(), ctx.BnCtx());
    if (len != COMPRESSED_SIZE) {
        throw std::runtime_error("secp256k1: EC_POINT_point2oct failed");
    }
    return true;
}

bool PrivateKeyTweakAdd(const uint8_t* key, const uint8_t* tweak,
                        std::array<uint8_t, SCALAR_SIZE>& out) {
    Context& ctx = Context::ThreadLocal();
    BigNum k(key);
    BigNum t(tweak);
    if (BN_cmp(t.bn, ctx.Order()) >= 0) {
        return false;
    }

    BigNum sum;
    if (!BN_mod_add(sum.bn, k.bn, t.bn, ctx.Order(), ctx.BnCtx())) {
        throw std::runtime_error("secp256k1: BN_mod_add failed");
    }
    if (BN_is_zero(sum.bn)) {
        return false;
    }

    if (BN_bn2binpad(sum.bn, out.data(), static_cast<int>(out.size())) !=
        static_cast<int>(SCALAR_SIZE)) {
        throw std::runtime_error("secp256k1: BN_bn2binpad failed");
    }
    return true;
}

} // namespace secp256k1
} // namespace seedorder
