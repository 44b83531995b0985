#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <openssl/bn.h>

namespace cosmkit {

// Non-negative integer of arbitrary size, as chain amounts can exceed 64 bits
class Amount {
public:
    Amount();
    Amount(uint64_t value);
    Amount(const Amount& other);
    // A moved-from Amount is still usable: zero after construction, the
    // target's old value after assignment
    Amount(Amount&& other);
    Amount& operator=(const Amount& other);
    Amount& operator=(Amount&& other) noexcept;

    // Decimal digits only. Throws EncodingError::MalformedPayload.
    static Amount parse(std::string_view decimal);

    std::string to_string() const;
    bool is_zero() const;

    Amount operator+(const Amount& other) const;

    // Throws std::domain_error when other > *this
    Amount operator-(const Amount& other) const;

    Amount operator*(uint64_t factor) const;

    bool operator==(const Amount& other) const;
    bool operator<(const Amount& other) const;
    bool operator<=(const Amount& other) const { return !(other < *this); }
    bool operator>(const Amount& other) const { return other < *this; }

private:
    std::unique_ptr<BIGNUM, decltype(&BN_free)> value_;
};

struct Coin {
    Amount amount;
    std::string denom;

    // "1000uatom" style text
    static Coin parse(std::string_view text);
    std::string to_string() const;

    bool operator==(const Coin& other) const = default;
};

// Transaction fee: coins paid, gas limit, optional payer and fee granter
struct Fee {
    std::vector<Coin> amount;
    uint64_t gas_limit = 0;
    std::optional<std::string> payer;
    std::optional<std::string> granter;

    bool operator==(const Fee& other) const = default;
};

// Price of one unit of gas, e.g. "0.025uatom"
class GasPrice {
public:
    static GasPrice parse(std::string_view text);

    // ceil(gas * price) in the price's denom
    Coin fee_for(uint64_t gas) const;

    const std::string& denom() const { return denom_; }
    std::string to_string() const;

private:
    Amount mantissa_;       // Price with the decimal point removed
    uint32_t scale_ = 0;    // Number of fractional digits
    std::string denom_;
};

} // namespace cosmkit
