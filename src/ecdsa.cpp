#include "ecdsa.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include <openssl/ecdsa.h>
#include <openssl/crypto.h>
#include <openssl/obj_mac.h>
#include <algorithm>
#include <memory>
#include <vector>

namespace cosmkit {

namespace {

SigningError signing_failure(const std::string& what) {
    return SigningError(SigningError::ErrorType::InvalidKey, "Signing failed: " + what);
}

std::array<uint8_t, 32> hmac(const std::array<uint8_t, 32>& key, std::span<const uint8_t> data) {
    return HashUtils::hmac_sha256(key, data);
}

std::vector<uint8_t> concat(std::initializer_list<std::span<const uint8_t>> parts) {
    std::vector<uint8_t> out;
    for (auto part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

// RFC 6979 section 3.2 nonce generation with HMAC-SHA256 and no extra data.
//
// x is the private key and h1 the digest reduced mod n, both as 32 bytes.
//   V = 0x01 * 32, K = 0x00 * 32
//   K = HMAC_K(V || 0x00 || x || h1), V = HMAC_K(V)
//   K = HMAC_K(V || 0x01 || x || h1), V = HMAC_K(V)
// then repeatedly V = HMAC_K(V) until V is a valid scalar. Each call of
// next() continues the sequence, so a rejected candidate (r or s zero)
// simply asks for the following one.
class NonceGenerator {
public:
    NonceGenerator(std::span<const uint8_t> x, std::span<const uint8_t> h1) {
        v_.fill(0x01);
        k_.fill(0x00);
        const uint8_t zero = 0x00;
        const uint8_t one = 0x01;
        k_ = hmac(k_, concat({v_, {&zero, 1}, x, h1}));
        v_ = hmac(k_, v_);
        k_ = hmac(k_, concat({v_, {&one, 1}, x, h1}));
        v_ = hmac(k_, v_);
    }

    ~NonceGenerator() {
        OPENSSL_cleanse(v_.data(), v_.size());
        OPENSSL_cleanse(k_.data(), k_.size());
    }

    Scalar next() {
        while (true) {
            if (started_) {
                const uint8_t zero = 0x00;
                k_ = hmac(k_, concat({v_, {&zero, 1}}));
                v_ = hmac(k_, v_);
            }
            started_ = true;
            v_ = hmac(k_, v_);
            if (Curve::is_valid_scalar(v_)) {
                return v_;
            }
        }
    }

private:
    std::array<uint8_t, 32> v_;
    std::array<uint8_t, 32> k_;
    bool started_ = false;
};

} // namespace

Signature Ecdsa::sign(const PrivateKey& key, std::span<const uint8_t> message) {
    return sign_digest(key, HashUtils::sha256(message));
}

// Signs a digest with ECDSA on secp256k1 using a deterministic nonce.
//
// With private key d, digest e and nonce k from RFC 6979:
//   r = x(k * G) mod n
//   s = k^-1 * (e + r * d) mod n
// retrying with the next nonce if r or s is zero.
//
// For any valid (r, s), (r, n - s) is valid too. Chains accept only the
// lower of the two, so s is replaced by n - s whenever s > n/2.
//
// The output is the 64-byte compact form r || s, each 32 bytes big-endian.
Signature Ecdsa::sign_digest(const PrivateKey& key, const Digest& digest) {
    auto d = Curve::to_bn(key.secret());
    if (BN_is_zero(d.get()) || BN_cmp(d.get(), Curve::order()) >= 0) {
        throw SigningError(SigningError::ErrorType::InvalidKey, "Private key is out of range");
    }

    const BIGNUM* n = Curve::order();
    auto ctx = Curve::new_ctx();

    // h1 = digest mod n, used both as the nonce input and as e
    auto e = Curve::to_bn(digest);
    if (!BN_nnmod(e.get(), e.get(), n, ctx.get())) {
        throw signing_failure("BN_nnmod");
    }
    auto h1 = Curve::to_scalar(e.get());

    NonceGenerator nonces(key.secret(), h1);

    auto half_order = Curve::new_bn();
    if (!BN_rshift1(half_order.get(), n)) {
        throw signing_failure("BN_rshift1");
    }

    while (true) {
        auto nonce = nonces.next();
        auto k = Curve::to_bn(nonce);
        OPENSSL_cleanse(nonce.data(), nonce.size());

        // R = k * G, r = x(R) mod n
        auto point = Curve::new_point();
        auto x = Curve::new_bn();
        auto r = Curve::new_bn();
        if (!EC_POINT_mul(Curve::group(), point.get(), k.get(), nullptr, nullptr, ctx.get()) ||
            !EC_POINT_get_affine_coordinates(Curve::group(), point.get(), x.get(), nullptr, ctx.get()) ||
            !BN_nnmod(r.get(), x.get(), n, ctx.get())) {
            throw signing_failure("nonce point");
        }
        if (BN_is_zero(r.get())) {
            continue;
        }

        // s = k^-1 * (e + r * d) mod n
        auto k_inv = Curve::new_bn();
        auto rd = Curve::new_bn();
        auto s = Curve::new_bn();
        if (!BN_mod_inverse(k_inv.get(), k.get(), n, ctx.get()) ||
            !BN_mod_mul(rd.get(), r.get(), d.get(), n, ctx.get()) ||
            !BN_mod_add(s.get(), e.get(), rd.get(), n, ctx.get()) ||
            !BN_mod_mul(s.get(), s.get(), k_inv.get(), n, ctx.get())) {
            throw signing_failure("scalar arithmetic");
        }
        if (BN_is_zero(s.get())) {
            continue;
        }

        // Low-S normalization
        if (BN_cmp(s.get(), half_order.get()) > 0) {
            if (!BN_sub(s.get(), n, s.get())) {
                throw signing_failure("BN_sub");
            }
        }

        Signature signature;
        auto r_bytes = Curve::to_scalar(r.get());
        auto s_bytes = Curve::to_scalar(s.get());
        std::copy(r_bytes.begin(), r_bytes.end(), signature.begin());
        std::copy(s_bytes.begin(), s_bytes.end(), signature.begin() + 32);
        return signature;
    }
}

bool Ecdsa::verify(const PublicKey& key, std::span<const uint8_t> message, const Signature& signature) {
    return verify_digest(key, HashUtils::sha256(message), signature);
}

// Verification goes through OpenSSL's ECDSA_do_verify after splitting the
// compact signature into r and s
bool Ecdsa::verify_digest(const PublicKey& key, const Digest& digest, const Signature& signature) {
    if (!is_low_s(signature)) {
        return false;
    }

    std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)> ec_key(
        EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    if (!ec_key) {
        throw Error("EC_KEY_new_by_curve_name failed");
    }
    auto point = Curve::decode_point(key.bytes());
    if (!point || !EC_KEY_set_public_key(ec_key.get(), point.get())) {
        return false;
    }

    std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(ECDSA_SIG_new(), ECDSA_SIG_free);
    BIGNUM* r = BN_bin2bn(signature.data(), 32, nullptr);
    BIGNUM* s = BN_bin2bn(signature.data() + 32, 32, nullptr);
    if (!sig || !r || !s || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
        BN_free(r);
        BN_free(s);
        throw Error("Failed to build ECDSA_SIG");
    }

    return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig.get(), ec_key.get()) == 1;
}

bool Ecdsa::is_low_s(const Signature& signature) {
    auto s = Curve::to_bn(std::span<const uint8_t>(signature).subspan(32));
    auto half_order = Curve::new_bn();
    if (!BN_rshift1(half_order.get(), Curve::order())) {
        throw Error("BN_rshift1 failed");
    }
    return BN_cmp(s.get(), half_order.get()) <= 0;
}

} // namespace cosmkit
