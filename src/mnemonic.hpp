#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>
#include "consts.hpp"
#include "secure_bytes.hpp"

namespace cosmkit {

// The 2048 BIP39 English words, sorted
const std::array<std::string_view, WORDLIST_SIZE>& english_wordlist();

// A BIP39 seed phrase.
//
// A phrase encodes ENT bits of entropy (128..256, a multiple of 32) followed
// by the first ENT/32 bits of SHA256(entropy), split into 11-bit word indices.
// Holds the normalized phrase text (lower-case, single spaces) and erases it
// on destruction. Deliberately has no stream operator.
class Mnemonic {
public:
    // Fresh phrase from OpenSSL's CSPRNG. strength_bits must be 128, 160, 192, 224 or 256.
    static Mnemonic generate(size_t strength_bits = 256);

    // Deterministic phrase for the given 16/20/24/28/32 bytes of entropy
    static Mnemonic from_entropy(std::span<const uint8_t> entropy);

    // Normalizes and checks a caller-supplied phrase. Throws PhraseError.
    static Mnemonic parse(std::string_view phrase);

    // Same checks as parse() without keeping the result
    static void validate(std::string_view phrase);

    Mnemonic(const Mnemonic& other) = default;
    Mnemonic(Mnemonic&& other) noexcept = default;
    Mnemonic& operator=(const Mnemonic& other) = default;
    Mnemonic& operator=(Mnemonic&& other) noexcept = default;
    ~Mnemonic();

    // Recovers the entropy the phrase encodes
    std::vector<uint8_t> to_entropy() const;

    // 64-byte BIP39 seed: PBKDF2-HMAC-SHA512(phrase, "mnemonic" + passphrase, 2048)
    SecureBytes to_seed(std::string_view passphrase = "") const;

    std::vector<std::string> words() const;
    size_t word_count() const { return word_count_; }
    const std::string& phrase() const { return phrase_; }

private:
    Mnemonic(std::string phrase, size_t word_count)
        : phrase_(std::move(phrase)), word_count_(word_count) {}

    std::string phrase_;
    size_t word_count_;
};

// Validates phrase and derives its seed in one step
SecureBytes seed_from_phrase(std::string_view phrase, std::string_view passphrase = "");

} // namespace cosmkit
