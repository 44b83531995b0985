#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include "coin.hpp"

namespace cosmkit {

// Chain message as a protobuf Any: type URL plus the already-encoded value.
// The library never looks inside value; callers bring their own encoders.
struct Msg {
    std::string type_url;
    std::vector<uint8_t> value;

    // google.protobuf.Any{type_url = 1, value = 2}.
    // Throws EncodingError::MalformedPayload for an empty type URL.
    std::vector<uint8_t> encode_any() const;

    bool operator==(const Msg&) const = default;
};

// cosmos.base.v1beta1.Coin{denom = 1, amount = 2 (decimal string)}
std::vector<uint8_t> encode_coin(const Coin& coin);

// cosmos.bank.v1beta1.MsgSend{from_address = 1, to_address = 2, amount = 3}
Msg encode_msg_send(std::string_view from_address, std::string_view to_address, const std::vector<Coin>& amount);

} // namespace cosmkit
