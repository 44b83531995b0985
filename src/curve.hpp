#pragma once

#include <array>
#include <memory>
#include <span>
#include <cstdint>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include "consts.hpp"

namespace cosmkit {

using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

using Scalar = std::array<uint8_t, PRIVATE_KEY_SIZE>;
using CompressedPoint = std::array<uint8_t, COMPRESSED_PUBKEY_SIZE>;

// Curve is a utility class wrapping the OpenSSL secp256k1 arithmetic shared by
// key derivation and signing. Every function is safe to call concurrently.
class Curve {
public:
    // Process-wide secp256k1 group; immutable after first use
    static const EC_GROUP* group();

    // Group order n
    static const BIGNUM* order();

    static BnPtr new_bn();
    static BnCtxPtr new_ctx();
    static EcPointPtr new_point();

    // Big-endian bytes to BIGNUM
    static BnPtr to_bn(std::span<const uint8_t> bytes);

    // BIGNUM to 32 big-endian bytes, left padded
    static Scalar to_scalar(const BIGNUM* bn);

    // True when 1 <= scalar < n
    static bool is_valid_scalar(std::span<const uint8_t> scalar);

    // scalar * G, compressed. The scalar must already be valid.
    static CompressedPoint multiply_generator(std::span<const uint8_t> scalar);

    // Parses a compressed point; returns nullptr when it is not on the curve
    static EcPointPtr decode_point(std::span<const uint8_t> compressed);

    static CompressedPoint encode_point(const EC_POINT* point);

    // (a + b) mod n; all zero bytes when the sum is 0 mod n
    static Scalar add_mod_order(std::span<const uint8_t> a, std::span<const uint8_t> b);

    // tweak * G + point, compressed. Throws DerivationError::ScalarOutOfRange when
    // the result is the point at infinity.
    static CompressedPoint add_tweak(std::span<const uint8_t> compressed, std::span<const uint8_t> tweak);

private:
    Curve() = delete;
};

} // namespace cosmkit
