#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace cosmkit {

// Decoded bech32 string: human-readable prefix and the 8-bit payload
struct Bech32Data {
    std::string hrp;
    std::vector<uint8_t> data;
};

// Bech32 (BIP173) text encoding of addresses and public keys.
//
// The payload is regrouped from 8-bit bytes into 5-bit symbols, the
// human-readable prefix is mixed into a BCH checksum, and the result is
// written as <hrp> '1' <data symbols> <6 checksum symbols>.
class Bech32 {
public:
    // Encodes payload under hrp. Throws EncodingError::InvalidPrefix for an
    // unusable prefix.
    static std::string encode(std::string_view hrp, std::span<const uint8_t> payload);

    // Decodes and checksum-verifies text. Throws EncodingError::InvalidEncoding.
    static Bech32Data decode(std::string_view text);

    // Prefix rules: non-empty, printable ASCII (33..126), lower-case only
    static void validate_prefix(std::string_view hrp);

private:
    Bech32() = delete;
};

} // namespace cosmkit
