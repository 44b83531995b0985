#include "transaction.hpp"
#include "consts.hpp"
#include "ecdsa.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include "proto_writer.hpp"

namespace cosmkit {

namespace {

// cosmos.crypto.secp256k1.PubKey{key = 1} wrapped in an Any
std::vector<uint8_t> encode_public_key(const PublicKey& key) {
    ProtoWriter pub;
    pub.bytes_field(1, key.bytes());
    return Msg{SECP256K1_PUBKEY_TYPE_URL, pub.take()}.encode_any();
}

// ModeInfo{single = 1 {mode = 1}}
std::vector<uint8_t> encode_mode_info_direct() {
    ProtoWriter single;
    single.uint64_field(1, SIGN_MODE_DIRECT);
    ProtoWriter mode_info;
    mode_info.message_field(1, single.bytes(), true);
    return mode_info.take();
}

// Fee{amount = 1, gas_limit = 2, payer = 3, granter = 4}
std::vector<uint8_t> encode_fee(const Fee& fee) {
    ProtoWriter writer;
    for (const auto& coin : fee.amount) {
        writer.message_field(1, encode_coin(coin), true);
    }
    writer.uint64_field(2, fee.gas_limit);
    if (fee.payer) {
        writer.string_field(3, *fee.payer);
    }
    if (fee.granter) {
        writer.string_field(4, *fee.granter);
    }
    return writer.take();
}

} // namespace

// The transaction body, the part of the transaction every signer commits to.
//
// Messages are Any-encoded and written in caller order as repeated field 1.
// An empty memo and a zero timeout height are omitted.
std::vector<uint8_t> encode_body(const std::vector<Msg>& messages, std::string_view memo, uint64_t timeout_height) {
    if (messages.empty()) {
        throw EncodingError(EncodingError::ErrorType::MalformedPayload, "Transaction has no messages");
    }
    ProtoWriter writer;
    for (const auto& msg : messages) {
        writer.message_field(1, msg.encode_any(), true);
    }
    writer.string_field(2, memo)
          .uint64_field(3, timeout_height);
    return writer.take();
}

// AuthInfo carries who signs and what they pay.
//
// SignerInfo{public_key = 1, mode_info = 2, sequence = 3}
// The public key and mode info are always written; a zero sequence is
// omitted like any other proto3 default. The fee message is always written.
std::vector<uint8_t> encode_auth_info(const std::vector<SignerInfo>& signers, const Fee& fee) {
    const auto mode_info = encode_mode_info_direct();

    ProtoWriter writer;
    for (const auto& signer : signers) {
        ProtoWriter info;
        info.message_field(1, encode_public_key(signer.public_key), true)
            .message_field(2, mode_info, true)
            .uint64_field(3, signer.sequence);
        writer.message_field(1, info.bytes(), true);
    }
    writer.message_field(2, encode_fee(fee), true);
    return writer.take();
}

std::vector<uint8_t> encode_sign_doc(std::span<const uint8_t> body_bytes, std::span<const uint8_t> auth_info_bytes,
                                     std::string_view chain_id, uint64_t account_number) {
    ProtoWriter writer;
    writer.bytes_field(1, body_bytes)
          .bytes_field(2, auth_info_bytes)
          .string_field(3, chain_id)
          .uint64_field(4, account_number);
    return writer.take();
}

std::vector<uint8_t> build_sign_doc(const UnsignedTx& tx, std::string_view chain_id, uint64_t account_number) {
    auto body = encode_body(tx.messages, tx.memo, tx.timeout_height);
    auto auth_info = encode_auth_info(tx.signers, tx.fee);
    return encode_sign_doc(body, auth_info, chain_id, account_number);
}

std::vector<uint8_t> SignedTx::encode() const {
    ProtoWriter writer;
    writer.bytes_field(1, body_bytes)
          .bytes_field(2, auth_info_bytes);
    for (const auto& signature : signatures) {
        writer.repeated_bytes_field(3, signature);
    }
    return writer.take();
}

std::string SignedTx::hash() const {
    auto raw = encode();
    return HexUtils::encode_upper(HashUtils::sha256(raw));
}

// Signs a transaction in SIGN_MODE_DIRECT.
//
// Body and auth info are encoded once and shared by every signer. Each
// signer signs a SignDoc carrying its own account number; the signatures
// are stored in the same order as the signer infos.
SignedTx sign_transaction(const UnsignedTx& tx, std::string_view chain_id,
                          const std::vector<const PrivateKey*>& keys) {
    if (tx.signers.empty() || keys.size() != tx.signers.size()) {
        throw EncodingError(EncodingError::ErrorType::MalformedPayload,
                            "Expected one key per signer: " + std::to_string(tx.signers.size()) +
                            " signers, " + std::to_string(keys.size()) + " keys");
    }

    SignedTx signed_tx;
    signed_tx.body_bytes = encode_body(tx.messages, tx.memo, tx.timeout_height);
    signed_tx.auth_info_bytes = encode_auth_info(tx.signers, tx.fee);
    signed_tx.signatures.reserve(keys.size());

    for (size_t i = 0; i < keys.size(); ++i) {
        const PrivateKey* key = keys[i];
        if (!key || !(key->public_key() == tx.signers[i].public_key)) {
            throw SigningError(SigningError::ErrorType::InvalidKey,
                               "Key " + std::to_string(i) + " does not match its signer's public key");
        }
        auto sign_doc = encode_sign_doc(signed_tx.body_bytes, signed_tx.auth_info_bytes,
                                        chain_id, tx.signers[i].account_number);
        signed_tx.signatures.push_back(Ecdsa::sign(*key, sign_doc));
    }
    return signed_tx;
}

SignedTx sign_transaction(const UnsignedTx& tx, std::string_view chain_id, const PrivateKey& key) {
    return sign_transaction(tx, chain_id, std::vector<const PrivateKey*>{&key});
}

} // namespace cosmkit
