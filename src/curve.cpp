#include "curve.hpp"
#include "error.hpp"
#include <openssl/obj_mac.h>

namespace cosmkit {

namespace {

struct CurveParams {
    EC_GROUP* group;
    BIGNUM* order;

    CurveParams() : group(EC_GROUP_new_by_curve_name(NID_secp256k1)), order(BN_new()) {
        if (!group || !order || !EC_GROUP_get_order(group, order, nullptr)) {
            throw Error("Failed to initialize secp256k1 parameters");
        }
    }

    ~CurveParams() {
        BN_free(order);
        EC_GROUP_free(group);
    }
};

const CurveParams& params() {
    static const CurveParams instance;
    return instance;
}

} // namespace

const EC_GROUP* Curve::group() {
    return params().group;
}

const BIGNUM* Curve::order() {
    return params().order;
}

BnPtr Curve::new_bn() {
    BnPtr bn(BN_new(), BN_clear_free);
    if (!bn) {
        throw Error("BN_new failed");
    }
    return bn;
}

BnCtxPtr Curve::new_ctx() {
    BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);
    if (!ctx) {
        throw Error("BN_CTX_new failed");
    }
    return ctx;
}

EcPointPtr Curve::new_point() {
    EcPointPtr point(EC_POINT_new(group()), EC_POINT_free);
    if (!point) {
        throw Error("EC_POINT_new failed");
    }
    return point;
}

BnPtr Curve::to_bn(std::span<const uint8_t> bytes) {
    BnPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), BN_clear_free);
    if (!bn) {
        throw Error("BN_bin2bn failed");
    }
    return bn;
}

Scalar Curve::to_scalar(const BIGNUM* bn) {
    Scalar out{};
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != static_cast<int>(out.size())) {
        throw Error("Value does not fit in 32 bytes");
    }
    return out;
}

bool Curve::is_valid_scalar(std::span<const uint8_t> scalar) {
    if (scalar.size() != PRIVATE_KEY_SIZE) {
        return false;
    }
    auto bn = to_bn(scalar);
    return !BN_is_zero(bn.get()) && BN_cmp(bn.get(), order()) < 0;
}

// Computes public_key = scalar * G and serializes it in compressed form:
// 0x02 or 0x03 for even or odd y, then the 32-byte x coordinate.
CompressedPoint Curve::multiply_generator(std::span<const uint8_t> scalar) {
    auto k = to_bn(scalar);
    auto point = new_point();
    auto ctx = new_ctx();
    if (!EC_POINT_mul(group(), point.get(), k.get(), nullptr, nullptr, ctx.get())) {
        throw Error("EC_POINT_mul failed");
    }
    return encode_point(point.get());
}

EcPointPtr Curve::decode_point(std::span<const uint8_t> compressed) {
    EcPointPtr none(nullptr, EC_POINT_free);
    if (compressed.size() != COMPRESSED_PUBKEY_SIZE ||
        (compressed[0] != 0x02 && compressed[0] != 0x03)) {
        return none;
    }
    auto point = new_point();
    auto ctx = new_ctx();
    if (!EC_POINT_oct2point(group(), point.get(), compressed.data(), compressed.size(), ctx.get())) {
        return none;
    }
    return point;
}

CompressedPoint Curve::encode_point(const EC_POINT* point) {
    CompressedPoint out{};
    size_t size = EC_POINT_point2oct(group(), point, POINT_CONVERSION_COMPRESSED,
                                     out.data(), out.size(), nullptr);
    if (size != out.size()) {
        throw Error("EC_POINT_point2oct failed");
    }
    return out;
}

Scalar Curve::add_mod_order(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    auto lhs = to_bn(a);
    auto rhs = to_bn(b);
    auto sum = new_bn();
    auto ctx = new_ctx();
    if (!BN_mod_add(sum.get(), lhs.get(), rhs.get(), order(), ctx.get())) {
        throw Error("BN_mod_add failed");
    }
    return to_scalar(sum.get());
}

CompressedPoint Curve::add_tweak(std::span<const uint8_t> compressed, std::span<const uint8_t> tweak) {
    auto parent = decode_point(compressed);
    if (!parent) {
        throw EncodingError(EncodingError::ErrorType::MalformedPayload, "Invalid compressed public key");
    }
    auto t = to_bn(tweak);
    auto result = new_point();
    auto ctx = new_ctx();

    // result = t * G + 1 * parent
    auto one = new_bn();
    if (!BN_one(one.get()) ||
        !EC_POINT_mul(group(), result.get(), t.get(), parent.get(), one.get(), ctx.get())) {
        throw Error("EC_POINT_mul failed");
    }
    if (EC_POINT_is_at_infinity(group(), result.get())) {
        throw DerivationError(DerivationError::ErrorType::ScalarOutOfRange,
                              "Derived public key is the point at infinity");
    }
    return encode_point(result.get());
}

} // namespace cosmkit
