#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>
#include "error.hpp"

namespace cosmkit {

class HexUtils {
public:
    // Convert a hexadecimal string (either case) to a byte vector
    static std::vector<uint8_t> decode(std::string_view hex) {
        if (hex.length() % 2 != 0) {
            throw EncodingError(EncodingError::ErrorType::InvalidEncoding, "Invalid hex string length");
        }

        std::vector<uint8_t> bytes;
        bytes.reserve(hex.length() / 2);

        for (size_t i = 0; i < hex.length(); i += 2) {
            bytes.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
        }

        return bytes;
    }

    // Convert bytes to a lower-case hexadecimal string
    static std::string encode(std::span<const uint8_t> data) {
        return encode_with(data, "0123456789abcdef");
    }

    // Upper-case form, used for transaction hashes and hex addresses
    static std::string encode_upper(std::span<const uint8_t> data) {
        return encode_with(data, "0123456789ABCDEF");
    }

private:
    static uint8_t nibble(char c) {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw EncodingError(EncodingError::ErrorType::InvalidEncoding,
                            std::string("Invalid hex character '") + c + "'");
    }

    static std::string encode_with(std::span<const uint8_t> data, const char* hex_chars) {
        std::string result;
        result.reserve(data.size() * 2);
        for (uint8_t byte : data) {
            result.push_back(hex_chars[byte >> 4]);
            result.push_back(hex_chars[byte & 0x0F]);
        }
        return result;
    }
};

} // namespace cosmkit
