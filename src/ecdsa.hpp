#pragma once

#include <array>
#include <span>
#include <cstdint>
#include "keys.hpp"

namespace cosmkit {

using Digest = std::array<uint8_t, 32>;

// Deterministic ECDSA over secp256k1 producing 64-byte compact signatures
class Ecdsa {
public:
    // Signs SHA256(message)
    static Signature sign(const PrivateKey& key, std::span<const uint8_t> message);

    // Signs a caller-computed 32-byte digest
    static Signature sign_digest(const PrivateKey& key, const Digest& digest);

    // Verifies a compact signature over SHA256(message). High-S signatures are rejected.
    static bool verify(const PublicKey& key, std::span<const uint8_t> message, const Signature& signature);

    static bool verify_digest(const PublicKey& key, const Digest& digest, const Signature& signature);

    // True when s <= n/2
    static bool is_low_s(const Signature& signature);

private:
    Ecdsa() = delete;
};

} // namespace cosmkit
