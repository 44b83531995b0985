#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cosmkit {

// Base class for every error the library throws.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or unverifiable seed phrase
class PhraseError : public Error {
public:
    enum class ErrorType {
        InvalidChecksum,
        UnknownWord,
        InvalidLength,
        InvalidStrength
    };

    PhraseError(ErrorType type, const std::string& message = "")
        : Error(message.empty() ? "Seed phrase error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Bad derivation path or a derived scalar outside [1, n-1]
class DerivationError : public Error {
public:
    enum class ErrorType {
        InvalidPath,
        ScalarOutOfRange
    };

    DerivationError(ErrorType type, const std::string& message = "")
        : Error(message.empty() ? "Key derivation error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

class SigningError : public Error {
public:
    enum class ErrorType {
        InvalidKey
    };

    SigningError(ErrorType type, const std::string& message = "")
        : Error(message.empty() ? "Signing error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Text and wire encoding failures (bech32, hex, base64, protobuf, node JSON)
class EncodingError : public Error {
public:
    enum class ErrorType {
        MalformedPayload,
        InvalidPrefix,
        InvalidEncoding
    };

    EncodingError(ErrorType type, const std::string& message = "")
        : Error(message.empty() ? "Encoding error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

class SequenceError : public Error {
public:
    enum class ErrorType {
        Stale,
        Unknown
    };

    SequenceError(ErrorType type, const std::string& message = "")
        : Error(message.empty() ? "Account sequence error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// A submission the node refused, or a node that could not be reached.
// code, codespace and raw_log are copied from the node's response when there was one.
class BroadcastError : public Error {
public:
    enum class ErrorType {
        InvalidSignature,
        InsufficientFee,
        MempoolFull,
        NodeUnavailable,
        SequenceMismatch,
        MalformedPayload,
        Rejected
    };

    BroadcastError(ErrorType type, const std::string& message = "",
                   uint32_t code = 0, std::string codespace = "", std::string raw_log = "")
        : Error(message.empty() ? "Broadcast error" : message)
        , type_(type)
        , code_(code)
        , codespace_(std::move(codespace))
        , raw_log_(std::move(raw_log))
    {}

    ErrorType type() const { return type_; }
    uint32_t code() const { return code_; }
    const std::string& codespace() const { return codespace_; }
    const std::string& raw_log() const { return raw_log_; }

private:
    ErrorType type_;
    uint32_t code_;
    std::string codespace_;
    std::string raw_log_;
};

// Thrown by Broadcaster::wait_for_tx when the deadline passes first
class ConfirmationTimeout : public Error {
public:
    explicit ConfirmationTimeout(std::string tx_hash)
        : Error("Transaction " + tx_hash + " was not included before the deadline")
        , tx_hash_(std::move(tx_hash))
    {}

    const std::string& tx_hash() const { return tx_hash_; }

private:
    std::string tx_hash_;
};

} // namespace cosmkit
