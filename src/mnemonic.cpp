#include "mnemonic.hpp"
#include "hash_utils.hpp"
#include "error.hpp"
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace cosmkit {

namespace {

// Lower-cases the phrase and collapses runs of whitespace into single spaces
std::string normalize(std::string_view phrase) {
    std::string out;
    out.reserve(phrase.size());
    bool pending_space = false;
    for (char c : phrase) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

bool valid_entropy_size(size_t bytes) {
    return bytes >= 16 && bytes <= 32 && bytes % 4 == 0;
}

bool valid_word_count(size_t count) {
    return count >= 12 && count <= 24 && count % 3 == 0;
}

int word_index(std::string_view word) {
    const auto& list = english_wordlist();
    auto it = std::lower_bound(list.begin(), list.end(), word);
    if (it == list.end() || *it != word) {
        return -1;
    }
    return static_cast<int>(it - list.begin());
}

std::vector<std::string> split_words(const std::string& phrase) {
    std::vector<std::string> words;
    std::istringstream stream(phrase);
    std::string word;
    while (stream >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

// Rebuilds entropy from a normalized phrase, checking every rule on the way
std::vector<uint8_t> decode_phrase(const std::string& phrase) {
    auto words = split_words(phrase);
    if (!valid_word_count(words.size())) {
        throw PhraseError(PhraseError::ErrorType::InvalidLength,
                          "Seed phrase must have 12, 15, 18, 21 or 24 words, got " +
                          std::to_string(words.size()));
    }

    const size_t total_bits = words.size() * 11;
    const size_t checksum_bits = total_bits / 33;
    const size_t entropy_bits = total_bits - checksum_bits;

    // One extra byte holds the checksum bits
    std::vector<uint8_t> bits((total_bits + 7) / 8, 0);
    size_t bit_pos = 0;
    for (const auto& word : words) {
        int index = word_index(word);
        if (index < 0) {
            throw PhraseError(PhraseError::ErrorType::UnknownWord, "Unknown seed phrase word: " + word);
        }
        for (int b = 10; b >= 0; --b, ++bit_pos) {
            if ((index >> b) & 1) {
                bits[bit_pos / 8] |= static_cast<uint8_t>(0x80 >> (bit_pos % 8));
            }
        }
    }

    std::vector<uint8_t> entropy(bits.begin(), bits.begin() + entropy_bits / 8);
    auto hash = HashUtils::sha256(entropy);

    // Checksum occupies the top checksum_bits of the byte after the entropy
    uint8_t mask = static_cast<uint8_t>(0xff << (8 - checksum_bits));
    if ((bits[entropy_bits / 8] & mask) != (hash[0] & mask)) {
        OPENSSL_cleanse(entropy.data(), entropy.size());
        OPENSSL_cleanse(bits.data(), bits.size());
        throw PhraseError(PhraseError::ErrorType::InvalidChecksum, "Seed phrase checksum mismatch");
    }

    OPENSSL_cleanse(bits.data(), bits.size());
    return entropy;
}

} // namespace

Mnemonic::~Mnemonic() {
    OPENSSL_cleanse(phrase_.data(), phrase_.size());
}

Mnemonic Mnemonic::generate(size_t strength_bits) {
    if (strength_bits % 32 != 0 || !valid_entropy_size(strength_bits / 8)) {
        throw PhraseError(PhraseError::ErrorType::InvalidStrength,
                          "Strength must be 128, 160, 192, 224 or 256 bits, got " +
                          std::to_string(strength_bits));
    }

    SecureBytes entropy(strength_bits / 8);
    if (RAND_bytes(entropy.data(), static_cast<int>(entropy.size())) != 1) {
        throw Error("Failed to gather entropy from the system random source");
    }
    return from_entropy(entropy.span());
}

// Maps entropy to words.
//
// 1. Append the first ENT/32 bits of SHA256(entropy) to the entropy
// 2. Split the ENT + ENT/32 bits into 11-bit groups, most significant first
// 3. Each group indexes the wordlist
Mnemonic Mnemonic::from_entropy(std::span<const uint8_t> entropy) {
    if (!valid_entropy_size(entropy.size())) {
        throw PhraseError(PhraseError::ErrorType::InvalidStrength,
                          "Entropy must be 16, 20, 24, 28 or 32 bytes, got " +
                          std::to_string(entropy.size()));
    }

    auto hash = HashUtils::sha256(entropy);
    std::vector<uint8_t> bits(entropy.begin(), entropy.end());
    bits.push_back(hash[0]);

    const size_t word_count = (entropy.size() * 8 + entropy.size() / 4) / 11;
    const auto& list = english_wordlist();

    std::string phrase;
    size_t bit_pos = 0;
    for (size_t w = 0; w < word_count; ++w) {
        int index = 0;
        for (int b = 0; b < 11; ++b, ++bit_pos) {
            index = (index << 1) | ((bits[bit_pos / 8] >> (7 - bit_pos % 8)) & 1);
        }
        if (!phrase.empty()) {
            phrase.push_back(' ');
        }
        phrase.append(list[static_cast<size_t>(index)]);
    }

    OPENSSL_cleanse(bits.data(), bits.size());
    return Mnemonic(std::move(phrase), word_count);
}

Mnemonic Mnemonic::parse(std::string_view phrase) {
    std::string normalized = normalize(phrase);
    auto entropy = decode_phrase(normalized);
    OPENSSL_cleanse(entropy.data(), entropy.size());
    size_t count = static_cast<size_t>(std::count(normalized.begin(), normalized.end(), ' ')) + 1;
    return Mnemonic(std::move(normalized), count);
}

void Mnemonic::validate(std::string_view phrase) {
    parse(phrase);
}

std::vector<uint8_t> Mnemonic::to_entropy() const {
    return decode_phrase(phrase_);
}

SecureBytes Mnemonic::to_seed(std::string_view passphrase) const {
    std::string salt = std::string(MNEMONIC_SALT_PREFIX) + std::string(passphrase);
    auto derived = HashUtils::pbkdf2_hmac_sha512(
        phrase_,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(salt.data()), salt.size()),
        PBKDF2_ROUNDS,
        SEED_SIZE);

    SecureBytes seed(derived.data(), derived.size());
    OPENSSL_cleanse(derived.data(), derived.size());
    OPENSSL_cleanse(salt.data(), salt.size());
    return seed;
}

std::vector<std::string> Mnemonic::words() const {
    return split_words(phrase_);
}

SecureBytes seed_from_phrase(std::string_view phrase, std::string_view passphrase) {
    return Mnemonic::parse(phrase).to_seed(passphrase);
}

} // namespace cosmkit
