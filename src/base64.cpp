#include "base64.hpp"
#include "error.hpp"
#include <openssl/evp.h>

namespace cosmkit {

std::string Base64::encode(std::span<const uint8_t> data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

// EVP_DecodeBlock works on whole 4-character groups and does not account for
// padding, so the '=' count is subtracted from its output length.
std::vector<uint8_t> Base64::decode(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw EncodingError(EncodingError::ErrorType::InvalidEncoding, "Invalid base64 length");
    }

    std::vector<uint8_t> out(3 * text.size() / 4);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw EncodingError(EncodingError::ErrorType::InvalidEncoding, "Invalid base64 data");
    }

    size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

} // namespace cosmkit
