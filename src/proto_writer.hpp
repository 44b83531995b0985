#pragma once

#include <string_view>
#include <vector>
#include <span>
#include <cstdint>

namespace cosmkit {

// Minimal protobuf (proto3) encoder for the handful of messages a
// transaction needs.
//
// Fields must be written in ascending field-number order. Scalar and
// length-delimited fields holding their default value (0, empty) are
// skipped, matching the canonical encoding the chain hashes and verifies.
// Embedded messages that are always present on the wire can be forced.
class ProtoWriter {
public:
    enum class WireType : uint8_t {
        Varint = 0,
        LengthDelimited = 2
    };

    ProtoWriter& uint64_field(uint32_t field, uint64_t value);
    ProtoWriter& bytes_field(uint32_t field, std::span<const uint8_t> value);
    ProtoWriter& string_field(uint32_t field, std::string_view value);

    // Writes an embedded message; with always set it is emitted even when empty
    ProtoWriter& message_field(uint32_t field, std::span<const uint8_t> encoded, bool always = false);

    // Writes a repeated bytes entry; repeated entries are kept even when empty
    ProtoWriter& repeated_bytes_field(uint32_t field, std::span<const uint8_t> value);

    const std::vector<uint8_t>& bytes() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }

    // Base-128 varint, least significant group first
    static void append_varint(std::vector<uint8_t>& out, uint64_t value);

private:
    void tag(uint32_t field, WireType type);
    void length_delimited(uint32_t field, std::span<const uint8_t> value);

    std::vector<uint8_t> buffer_;
};

} // namespace cosmkit
