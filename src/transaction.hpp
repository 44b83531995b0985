#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include "coin.hpp"
#include "keys.hpp"
#include "msg.hpp"

namespace cosmkit {

// One signer's slot in AuthInfo
struct SignerInfo {
    PublicKey public_key;
    uint64_t sequence = 0;
    uint64_t account_number = 0;
};

// Everything needed to produce the signable bytes
struct UnsignedTx {
    std::vector<Msg> messages;
    Fee fee;
    std::string memo;
    uint64_t timeout_height = 0;
    std::vector<SignerInfo> signers;
};

// Body, auth info and one signature per signer, in signer order
struct SignedTx {
    std::vector<uint8_t> body_bytes;
    std::vector<uint8_t> auth_info_bytes;
    std::vector<Signature> signatures;

    // cosmos.tx.v1beta1.TxRaw{body_bytes = 1, auth_info_bytes = 2, signatures = 3}
    std::vector<uint8_t> encode() const;

    // Upper-case hex SHA256 of encode(), the hash the node reports
    std::string hash() const;
};

// cosmos.tx.v1beta1.TxBody{messages = 1, memo = 2, timeout_height = 3}
std::vector<uint8_t> encode_body(const std::vector<Msg>& messages, std::string_view memo, uint64_t timeout_height);

// cosmos.tx.v1beta1.AuthInfo{signer_infos = 1, fee = 2}, every signer in SIGN_MODE_DIRECT
std::vector<uint8_t> encode_auth_info(const std::vector<SignerInfo>& signers, const Fee& fee);

// cosmos.tx.v1beta1.SignDoc{body_bytes = 1, auth_info_bytes = 2, chain_id = 3, account_number = 4}
std::vector<uint8_t> encode_sign_doc(std::span<const uint8_t> body_bytes, std::span<const uint8_t> auth_info_bytes,
                                     std::string_view chain_id, uint64_t account_number);

// The bytes a signer with the given account number signs. Deterministic.
std::vector<uint8_t> build_sign_doc(const UnsignedTx& tx, std::string_view chain_id, uint64_t account_number);

// Signs tx with one key per signer, in signer order. Each key must match its
// signer's public key (SigningError::InvalidKey); the key count must match the
// signer count (EncodingError::MalformedPayload).
SignedTx sign_transaction(const UnsignedTx& tx, std::string_view chain_id,
                          const std::vector<const PrivateKey*>& keys);

SignedTx sign_transaction(const UnsignedTx& tx, std::string_view chain_id, const PrivateKey& key);

} // namespace cosmkit
