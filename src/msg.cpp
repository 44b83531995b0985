#include "msg.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "proto_writer.hpp"

namespace cosmkit {

std::vector<uint8_t> Msg::encode_any() const {
    if (type_url.empty()) {
        throw EncodingError(EncodingError::ErrorType::MalformedPayload, "Message has an empty type URL");
    }
    ProtoWriter writer;
    writer.string_field(1, type_url)
          .bytes_field(2, value);
    return writer.take();
}

std::vector<uint8_t> encode_coin(const Coin& coin) {
    ProtoWriter writer;
    writer.string_field(1, coin.denom)
          .string_field(2, coin.amount.to_string());
    return writer.take();
}

Msg encode_msg_send(std::string_view from_address, std::string_view to_address, const std::vector<Coin>& amount) {
    ProtoWriter writer;
    writer.string_field(1, from_address)
          .string_field(2, to_address);
    for (const auto& coin : amount) {
        writer.message_field(3, encode_coin(coin), true);
    }
    return Msg{MSG_SEND_TYPE_URL, writer.take()};
}

} // namespace cosmkit
