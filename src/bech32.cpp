#include "bech32.hpp"
#include "error.hpp"

#include <array>
#include <cctype>

namespace cosmkit {

namespace {

constexpr std::array<char, 32> kCharset = {
    'q', 'p', 'z', 'r', 'y', '9', 'x', '8', 'g', 'f', '2', 't', 'v', 'd', 'w', '0',
    's', '3', 'j', 'n', '5', '4', 'k', 'h', 'c', 'e', '6', 'm', 'u', 'a', '7', 'l'};

constexpr std::array<int, 128> create_decode_map() {
    std::array<int, 128> map{};
    map.fill(-1);
    for (size_t i = 0; i < kCharset.size(); ++i) {
        map[static_cast<unsigned>(kCharset[i])] = static_cast<int>(i);
    }
    return map;
}

constexpr auto kDecodeMap = create_decode_map();
constexpr uint32_t kBech32Constant = 1;
constexpr size_t kMaxLength = 1023;

uint32_t polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = chk >> 25;
        chk = (chk & 0x1ffffff) << 5 ^ v;
        if (top & 0x01) chk ^= 0x3b6a57b2;
        if (top & 0x02) chk ^= 0x26508e6d;
        if (top & 0x04) chk ^= 0x1ea119fa;
        if (top & 0x08) chk ^= 0x3d4233dd;
        if (top & 0x10) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> hrp_expand(std::string_view hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) >> 5));
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(std::tolower(static_cast<unsigned char>(c)) & 0x1f));
    }
    return ret;
}

bool convert_bits(std::vector<uint8_t>& out, int from_bits, int to_bits, bool pad,
                  std::span<const uint8_t> data) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    for (uint8_t value : data) {
        if (value >> from_bits) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
        return false;
    }
    return true;
}

EncodingError invalid(const std::string& what) {
    return EncodingError(EncodingError::ErrorType::InvalidEncoding, "Invalid bech32 string: " + what);
}

} // namespace

void Bech32::validate_prefix(std::string_view hrp) {
    if (hrp.empty()) {
        throw EncodingError(EncodingError::ErrorType::InvalidPrefix, "Address prefix is empty");
    }
    for (char c : hrp) {
        if (c < 33 || c > 126) {
            throw EncodingError(EncodingError::ErrorType::InvalidPrefix,
                                "Address prefix contains a non-printable character");
        }
        if (std::isupper(static_cast<unsigned char>(c))) {
            throw EncodingError(EncodingError::ErrorType::InvalidPrefix,
                                "Address prefix must be lower-case: " + std::string(hrp));
        }
    }
}

// Encodes a payload as bech32.
//
// 1. Regroup the payload bytes into 5-bit symbols (zero padded at the end)
// 2. Compute the checksum over the expanded prefix, the symbols and six zeros
// 3. Emit the prefix, the separator '1', the symbols and the checksum
std::string Bech32::encode(std::string_view hrp, std::span<const uint8_t> payload) {
    validate_prefix(hrp);

    std::vector<uint8_t> data;
    data.reserve((payload.size() * 8 + 4) / 5);
    convert_bits(data, 8, 5, true, payload);

    std::vector<uint8_t> values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), 6, 0);
    uint32_t mod = polymod(values) ^ kBech32Constant;

    std::string ret;
    ret.reserve(hrp.size() + data.size() + 7);
    ret.append(hrp);
    ret.push_back('1');
    for (uint8_t v : data) {
        ret.push_back(kCharset[v]);
    }
    for (int i = 0; i < 6; ++i) {
        ret.push_back(kCharset[(mod >> (5 * (5 - i))) & 31]);
    }
    return ret;
}

// Decodes bech32 text. Mixed case is rejected; an all upper-case string is
// accepted and its prefix is returned lower-cased.
Bech32Data Bech32::decode(std::string_view text) {
    if (text.size() < 8 || text.size() > kMaxLength) {
        throw invalid("bad length");
    }
    bool lower = false;
    bool upper = false;
    for (char c : text) {
        if (std::isupper(static_cast<unsigned char>(c))) upper = true;
        if (std::islower(static_cast<unsigned char>(c))) lower = true;
    }
    if (upper && lower) {
        throw invalid("mixed case");
    }

    auto pos = text.rfind('1');
    if (pos == std::string_view::npos || pos == 0 || pos + 7 > text.size()) {
        throw invalid("missing separator");
    }

    Bech32Data result;
    for (char c : text.substr(0, pos)) {
        if (c < 33 || c > 126) {
            throw invalid("bad prefix character");
        }
        result.hrp.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    std::vector<uint8_t> data;
    data.reserve(text.size() - pos - 1);
    for (char c : text.substr(pos + 1)) {
        unsigned char uc = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(c)));
        if (uc > 127 || kDecodeMap[uc] == -1) {
            throw invalid("bad data character");
        }
        data.push_back(static_cast<uint8_t>(kDecodeMap[uc]));
    }

    std::vector<uint8_t> values = hrp_expand(result.hrp);
    values.insert(values.end(), data.begin(), data.end());
    if (polymod(values) != kBech32Constant) {
        throw invalid("checksum mismatch");
    }
    data.resize(data.size() - 6);

    if (!convert_bits(result.data, 5, 8, false, data)) {
        throw invalid("bad padding");
    }
    return result;
}

} // namespace cosmkit
