#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace cosmkit {

    // Key and address sizes
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;
    constexpr size_t ADDRESS_SIZE = 20;
    constexpr size_t CHAIN_CODE_SIZE = 32;
    constexpr size_t SIGNATURE_SIZE = 64;
    constexpr size_t SEED_SIZE = 64;

    // BIP32 / BIP44
    constexpr uint32_t HARDENED_OFFSET = 0x80000000;
    constexpr const char* BIP32_SEED_KEY = "Bitcoin seed";
    constexpr const char* DEFAULT_HD_PATH = "m/44'/118'/0'/0/0";

    // BIP39
    constexpr uint32_t PBKDF2_ROUNDS = 2048;
    constexpr const char* MNEMONIC_SALT_PREFIX = "mnemonic";
    constexpr size_t WORDLIST_SIZE = 2048;

    // Legacy amino prefix of a secp256k1 public key, used for the "cosmospub" text form
    constexpr std::array<uint8_t, 5> AMINO_PUBKEY_PREFIX = {0xeb, 0x5a, 0xe9, 0x87, 0x21};

    // Protobuf type URLs
    constexpr const char* SECP256K1_PUBKEY_TYPE_URL = "/cosmos.crypto.secp256k1.PubKey";
    constexpr const char* MSG_SEND_TYPE_URL = "/cosmos.bank.v1beta1.MsgSend";
    constexpr const char* MSG_MULTI_SEND_TYPE_URL = "/cosmos.bank.v1beta1.MsgMultiSend";
    constexpr const char* MSG_DELEGATE_TYPE_URL = "/cosmos.staking.v1beta1.MsgDelegate";
    constexpr const char* MSG_UNDELEGATE_TYPE_URL = "/cosmos.staking.v1beta1.MsgUndelegate";
    constexpr const char* MSG_BEGIN_REDELEGATE_TYPE_URL = "/cosmos.staking.v1beta1.MsgBeginRedelegate";
    constexpr const char* MSG_WITHDRAW_DELEGATOR_REWARD_TYPE_URL =
        "/cosmos.distribution.v1beta1.MsgWithdrawDelegatorReward";
    constexpr const char* MSG_VOTE_TYPE_URL = "/cosmos.gov.v1beta1.MsgVote";
    constexpr const char* MSG_TRANSFER_TYPE_URL = "/ibc.applications.transfer.v1.MsgTransfer";

    // cosmos.tx.signing.v1beta1.SignMode
    constexpr uint64_t SIGN_MODE_DIRECT = 1;

    // ABCI codes in the "sdk" codespace
    constexpr uint32_t SDK_CODE_OK = 0;
    constexpr uint32_t SDK_CODE_TX_DECODE = 2;
    constexpr uint32_t SDK_CODE_UNAUTHORIZED = 4;
    constexpr uint32_t SDK_CODE_INSUFFICIENT_FEE = 13;
    constexpr uint32_t SDK_CODE_TX_IN_MEMPOOL_CACHE = 19;
    constexpr uint32_t SDK_CODE_MEMPOOL_IS_FULL = 20;
    constexpr uint32_t SDK_CODE_WRONG_SEQUENCE = 32;
    constexpr const char* SDK_CODESPACE = "sdk";

    // Transactions
    constexpr const char* DEFAULT_MEMO = "Sent with cosmkit";
    constexpr uint64_t SIMULATION_GAS_LIMIT = 9223372036854775807ULL;

} // namespace cosmkit
