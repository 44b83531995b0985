#pragma once

#include <array>
#include <vector>
#include <span>
#include <string_view>
#include <cstdint>
#include <openssl/sha.h>
#include <openssl/ripemd.h>

namespace cosmkit {

// HashUtils collects the hash and MAC primitives used by key derivation,
// addressing and transaction hashing
class HashUtils {
public:
    // Returns the 32-byte SHA256 digest of data
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> sha256(std::span<const uint8_t> data);

    // Returns the 20-byte RIPEMD160 digest of data
    static std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> ripemd160(std::span<const uint8_t> data);

    // RIPEMD160(SHA256(data)), the account address of a compressed public key
    static std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> hash160(std::span<const uint8_t> data);

    static std::array<uint8_t, SHA256_DIGEST_LENGTH> hmac_sha256(std::span<const uint8_t> key,
                                                                 std::span<const uint8_t> data);

    static std::array<uint8_t, SHA512_DIGEST_LENGTH> hmac_sha512(std::span<const uint8_t> key,
                                                                 std::span<const uint8_t> data);

    // PBKDF2 with HMAC-SHA512, producing out_len bytes
    static std::vector<uint8_t> pbkdf2_hmac_sha512(std::string_view password,
                                                   std::span<const uint8_t> salt,
                                                   uint32_t iterations,
                                                   size_t out_len);

private:
    HashUtils() = delete;
};

} // namespace cosmkit
