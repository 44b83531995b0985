#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace cosmkit {

// Standard (padded) base64, used for tx_bytes and event attributes in node JSON
class Base64 {
public:
    static std::string encode(std::span<const uint8_t> data);

    // Throws EncodingError::InvalidEncoding on malformed input
    static std::vector<uint8_t> decode(std::string_view text);

private:
    Base64() = delete;
};

} // namespace cosmkit
