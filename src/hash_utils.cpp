#include "hash_utils.hpp"
#include "error.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace cosmkit {

// Computes the SHA256 hash of input data.
// Used for the transaction hash, the signing digest and the first half of
// the address hash.
std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::sha256(std::span<const uint8_t> data) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> HashUtils::ripemd160(std::span<const uint8_t> data) {
    std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> hash;
    RIPEMD160_CTX ripemd160;
    RIPEMD160_Init(&ripemd160);
    RIPEMD160_Update(&ripemd160, data.data(), data.size());
    RIPEMD160_Final(hash.data(), &ripemd160);
    return hash;
}

// Computes HASH160 (RIPEMD160(SHA256(data)))
// A 20-byte account address is the HASH160 of the 33-byte compressed public key.
std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> HashUtils::hash160(std::span<const uint8_t> data) {
    auto sha256_result = sha256(data);
    return ripemd160(std::span<const uint8_t>(sha256_result.data(), sha256_result.size()));
}

// HMAC-SHA256 drives the deterministic nonce generator of the signer
std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::hmac_sha256(std::span<const uint8_t> key,
                                                                 std::span<const uint8_t> data) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> mac;
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), mac.data(), &mac_len) ||
        mac_len != SHA256_DIGEST_LENGTH) {
        throw Error("HMAC-SHA256 failed");
    }
    return mac;
}

// HMAC-SHA512 is the core of BIP32: the left half of the output becomes the
// key material and the right half the chain code
std::array<uint8_t, SHA512_DIGEST_LENGTH> HashUtils::hmac_sha512(std::span<const uint8_t> key,
                                                                 std::span<const uint8_t> data) {
    std::array<uint8_t, SHA512_DIGEST_LENGTH> mac;
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), mac.data(), &mac_len) ||
        mac_len != SHA512_DIGEST_LENGTH) {
        throw Error("HMAC-SHA512 failed");
    }
    return mac;
}

// Stretches a password into out_len bytes.
// BIP39 calls this with the phrase as password, "mnemonic" + passphrase as
// salt and 2048 iterations.
std::vector<uint8_t> HashUtils::pbkdf2_hmac_sha512(std::string_view password,
                                                   std::span<const uint8_t> salt,
                                                   uint32_t iterations,
                                                   size_t out_len) {
    std::vector<uint8_t> out(out_len);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha512(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        throw Error("PBKDF2-HMAC-SHA512 failed");
    }
    return out;
}

} // namespace cosmkit
