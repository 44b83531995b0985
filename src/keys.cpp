#include "keys.hpp"
#include "bech32.hpp"
#include "ecdsa.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hd_key.hpp"
#include "hex_utils.hpp"
#include "mnemonic.hpp"
#include <openssl/crypto.h>
#include <algorithm>

namespace cosmkit {

Address Address::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != ADDRESS_SIZE) {
        throw EncodingError(EncodingError::ErrorType::MalformedPayload,
                            "Address must be 20 bytes, got " + std::to_string(bytes.size()));
    }
    std::array<uint8_t, ADDRESS_SIZE> raw;
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    return Address(raw);
}

std::pair<Address, std::string> Address::from_bech32(std::string_view text) {
    auto decoded = Bech32::decode(text);
    return {from_bytes(decoded.data), std::move(decoded.hrp)};
}

Address Address::from_bech32(std::string_view text, std::string_view expected_prefix) {
    auto [addr, prefix] = from_bech32(text);
    if (prefix != expected_prefix) {
        throw EncodingError(EncodingError::ErrorType::InvalidPrefix,
                            "Expected prefix '" + std::string(expected_prefix) + "', got '" + prefix + "'");
    }
    return addr;
}

std::string Address::to_bech32(std::string_view prefix) const {
    return Bech32::encode(prefix, bytes_);
}

std::string Address::to_hex_string() const {
    return HexUtils::encode_upper(bytes_);
}

PublicKey PublicKey::from_bytes(std::span<const uint8_t> bytes) {
    if (!Curve::decode_point(bytes)) {
        throw EncodingError(EncodingError::ErrorType::MalformedPayload, "Invalid compressed public key");
    }
    CompressedPoint point;
    std::copy(bytes.begin(), bytes.end(), point.begin());
    return PublicKey(point);
}

// The amino form prepends eb5ae98721 (type prefix plus length 33) to the
// compressed key before bech32 encoding
PublicKey PublicKey::from_bech32(std::string_view text) {
    auto decoded = Bech32::decode(text);
    const auto& data = decoded.data;
    if (data.size() != AMINO_PUBKEY_PREFIX.size() + COMPRESSED_PUBKEY_SIZE ||
        !std::equal(AMINO_PUBKEY_PREFIX.begin(), AMINO_PUBKEY_PREFIX.end(), data.begin())) {
        throw EncodingError(EncodingError::ErrorType::MalformedPayload,
                            "Not an amino-encoded secp256k1 public key");
    }
    return from_bytes(std::span<const uint8_t>(data).subspan(AMINO_PUBKEY_PREFIX.size()));
}

Address PublicKey::to_address() const {
    return Address(HashUtils::hash160(bytes_));
}

std::string PublicKey::to_bech32(std::string_view prefix) const {
    std::vector<uint8_t> data(AMINO_PUBKEY_PREFIX.begin(), AMINO_PUBKEY_PREFIX.end());
    data.insert(data.end(), bytes_.begin(), bytes_.end());
    return Bech32::encode(prefix, data);
}

std::string PublicKey::to_hex() const {
    return HexUtils::encode(bytes_);
}

std::string address(const PublicKey& public_key, std::string_view prefix) {
    return public_key.to_address().to_bech32(prefix);
}

PrivateKey PrivateKey::from_bytes(std::span<const uint8_t> bytes) {
    if (!Curve::is_valid_scalar(bytes)) {
        throw SigningError(SigningError::ErrorType::InvalidKey,
                           "Private key must be a 32-byte scalar in [1, n-1]");
    }
    SecureBytes secret(bytes);
    PublicKey public_key(Curve::multiply_generator(secret.span()));
    return PrivateKey(std::move(secret), public_key);
}

PrivateKey PrivateKey::from_hex(std::string_view hex) {
    auto bytes = HexUtils::decode(hex);
    try {
        auto key = from_bytes(bytes);
        OPENSSL_cleanse(bytes.data(), bytes.size());
        return key;
    } catch (...) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw;
    }
}

// Maps an arbitrary secret into [1, n-1]: (SHA256(secret) mod (n - 1)) + 1
PrivateKey PrivateKey::from_secret(std::span<const uint8_t> secret) {
    auto digest = HashUtils::sha256(secret);
    auto h = Curve::to_bn(digest);
    OPENSSL_cleanse(digest.data(), digest.size());

    auto n_minus_one = Curve::new_bn();
    auto k = Curve::new_bn();
    auto ctx = Curve::new_ctx();
    if (!BN_copy(n_minus_one.get(), Curve::order()) ||
        !BN_sub_word(n_minus_one.get(), 1) ||
        !BN_nnmod(k.get(), h.get(), n_minus_one.get(), ctx.get()) ||
        !BN_add_word(k.get(), 1)) {
        throw SigningError(SigningError::ErrorType::InvalidKey, "Failed to map secret to a scalar");
    }

    auto scalar = Curve::to_scalar(k.get());
    auto key = from_bytes(scalar);
    OPENSSL_cleanse(scalar.data(), scalar.size());
    return key;
}

PrivateKey PrivateKey::from_secret(std::string_view secret) {
    return from_secret(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(secret.data()), secret.size()));
}

PrivateKey PrivateKey::from_phrase(std::string_view phrase, std::string_view passphrase, std::string_view path) {
    auto derivation_path = DerivationPath::parse(path);
    auto seed = seed_from_phrase(phrase, passphrase);
    return from_extended_key(HdKey::derive_path(seed.span(), derivation_path));
}

PrivateKey PrivateKey::from_extended_key(const ExtendedKey& key) {
    return from_bytes(key.key);
}

PrivateKey PrivateKey::clone() const {
    return PrivateKey(secret_.clone(), public_key_);
}

std::string PrivateKey::to_bech32_address(std::string_view prefix) const {
    return address(public_key_, prefix);
}

Signature PrivateKey::sign(std::span<const uint8_t> message) const {
    return Ecdsa::sign(*this, message);
}

std::string PrivateKey::to_hex() const {
    return HexUtils::encode(secret_.span());
}

} // namespace cosmkit
