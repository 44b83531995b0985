#include "proto_writer.hpp"

namespace cosmkit {

void ProtoWriter::append_varint(std::vector<uint8_t>& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

void ProtoWriter::tag(uint32_t field, WireType type) {
    append_varint(buffer_, (static_cast<uint64_t>(field) << 3) | static_cast<uint8_t>(type));
}

void ProtoWriter::length_delimited(uint32_t field, std::span<const uint8_t> value) {
    tag(field, WireType::LengthDelimited);
    append_varint(buffer_, value.size());
    buffer_.insert(buffer_.end(), value.begin(), value.end());
}

ProtoWriter& ProtoWriter::uint64_field(uint32_t field, uint64_t value) {
    if (value != 0) {
        tag(field, WireType::Varint);
        append_varint(buffer_, value);
    }
    return *this;
}

ProtoWriter& ProtoWriter::bytes_field(uint32_t field, std::span<const uint8_t> value) {
    if (!value.empty()) {
        length_delimited(field, value);
    }
    return *this;
}

ProtoWriter& ProtoWriter::string_field(uint32_t field, std::string_view value) {
    return bytes_field(field, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(value.data()), value.size()));
}

ProtoWriter& ProtoWriter::message_field(uint32_t field, std::span<const uint8_t> encoded, bool always) {
    if (always || !encoded.empty()) {
        length_delimited(field, encoded);
    }
    return *this;
}

ProtoWriter& ProtoWriter::repeated_bytes_field(uint32_t field, std::span<const uint8_t> value) {
    length_delimited(field, value);
    return *this;
}

} // namespace cosmkit
