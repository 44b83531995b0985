#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <span>
#include <cstdint>
#include "consts.hpp"
#include "curve.hpp"
#include "secure_bytes.hpp"

namespace cosmkit {

struct ExtendedKey;
using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

// 20-byte account address: RIPEMD160(SHA256(compressed public key))
class Address {
public:
    explicit Address(const std::array<uint8_t, ADDRESS_SIZE>& bytes) : bytes_(bytes) {}

    // Throws EncodingError::MalformedPayload unless exactly 20 bytes
    static Address from_bytes(std::span<const uint8_t> bytes);

    // Decodes bech32 text and returns the address with its prefix
    static std::pair<Address, std::string> from_bech32(std::string_view text);

    // Decodes bech32 text whose prefix must equal expected_prefix
    static Address from_bech32(std::string_view text, std::string_view expected_prefix);

    std::string to_bech32(std::string_view prefix) const;

    // Upper-case hex of the 20 bytes
    std::string to_hex_string() const;

    const std::array<uint8_t, ADDRESS_SIZE>& bytes() const { return bytes_; }

    bool operator==(const Address&) const = default;

private:
    std::array<uint8_t, ADDRESS_SIZE> bytes_;
};

// Compressed secp256k1 public key
class PublicKey {
public:
    // Throws EncodingError::MalformedPayload unless bytes is a valid compressed point
    static PublicKey from_bytes(std::span<const uint8_t> bytes);

    // Parses the amino-prefixed bech32 form ("cosmospub1addwnpep...")
    static PublicKey from_bech32(std::string_view text);

    Address to_address() const;

    // Amino-prefixed bech32 form under the given prefix, e.g. "cosmospub"
    std::string to_bech32(std::string_view prefix) const;

    std::string to_hex() const;

    const CompressedPoint& bytes() const { return bytes_; }

    bool operator==(const PublicKey&) const = default;

private:
    explicit PublicKey(const CompressedPoint& bytes) : bytes_(bytes) {}

    friend class PrivateKey;

    CompressedPoint bytes_;
};

// Bech32 account address of a public key
std::string address(const PublicKey& public_key, std::string_view prefix);

// secp256k1 signing key. Move-only; the scalar lives in locked memory.
class PrivateKey {
public:
    // Throws SigningError::InvalidKey unless bytes is a 32-byte scalar in [1, n-1]
    static PrivateKey from_bytes(std::span<const uint8_t> bytes);

    static PrivateKey from_hex(std::string_view hex);

    // (SHA256(secret) mod (n - 1)) + 1. Handy for tests and throwaway keys.
    static PrivateKey from_secret(std::span<const uint8_t> secret);
    static PrivateKey from_secret(std::string_view secret);

    // BIP39 phrase + BIP32 path in one step
    static PrivateKey from_phrase(std::string_view phrase, std::string_view passphrase = "",
                                  std::string_view path = DEFAULT_HD_PATH);

    static PrivateKey from_extended_key(const ExtendedKey& key);

    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;

    PrivateKey clone() const;

    const PublicKey& public_key() const { return public_key_; }
    Address to_address() const { return public_key_.to_address(); }
    std::string to_bech32_address(std::string_view prefix) const;

    // Compact r || s over SHA256(message), see Ecdsa::sign
    Signature sign(std::span<const uint8_t> message) const;

    // Exposes the scalar. Only for callers that persist keys themselves.
    std::string to_hex() const;

    std::span<const uint8_t> secret() const { return secret_.span(); }

private:
    PrivateKey(SecureBytes secret, PublicKey public_key)
        : secret_(std::move(secret)), public_key_(public_key) {}

    SecureBytes secret_;
    PublicKey public_key_;
};

} // namespace cosmkit
