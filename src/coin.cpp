#include "coin.hpp"
#include "error.hpp"
#include <cctype>
#include <new>
#include <stdexcept>
#include <utility>

namespace cosmkit {

namespace {

EncodingError malformed(const std::string& what) {
    return EncodingError(EncodingError::ErrorType::MalformedPayload, what);
}

bool all_digits(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Denoms start with a letter; the rest may contain letters, digits and /:._-
bool valid_denom(std::string_view denom) {
    if (denom.size() < 2 || denom.size() > 128 || !std::isalpha(static_cast<unsigned char>(denom[0]))) {
        return false;
    }
    for (char c : denom) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '/' && c != ':' && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

std::unique_ptr<BIGNUM, decltype(&BN_free)> make_bn(uint64_t value) {
    std::unique_ptr<BIGNUM, decltype(&BN_free)> bn(BN_new(), BN_free);
    if (!bn || !BN_set_word(bn.get(), value)) {
        throw std::bad_alloc();
    }
    return bn;
}

} // namespace

Amount::Amount() : Amount(0) {}

Amount::Amount(uint64_t value) : value_(make_bn(value)) {}

Amount::Amount(const Amount& other) : value_(BN_dup(other.value_.get()), BN_free) {
    if (!value_) {
        throw std::bad_alloc();
    }
}

Amount::Amount(Amount&& other) : value_(make_bn(0)) {
    std::swap(value_, other.value_);
}

Amount& Amount::operator=(Amount&& other) noexcept {
    std::swap(value_, other.value_);
    return *this;
}

Amount& Amount::operator=(const Amount& other) {
    if (this != &other) {
        Amount copy(other);
        value_ = std::move(copy.value_);
    }
    return *this;
}

Amount Amount::parse(std::string_view decimal) {
    if (!all_digits(decimal)) {
        throw malformed("Invalid amount '" + std::string(decimal) + "'");
    }
    std::string text(decimal);
    Amount result;
    BIGNUM* bn = result.value_.get();
    if (!BN_dec2bn(&bn, text.c_str())) {
        throw malformed("Invalid amount '" + text + "'");
    }
    return result;
}

std::string Amount::to_string() const {
    char* text = BN_bn2dec(value_.get());
    if (!text) {
        throw std::bad_alloc();
    }
    std::string out(text);
    OPENSSL_free(text);
    return out;
}

bool Amount::is_zero() const {
    return BN_is_zero(value_.get());
}

Amount Amount::operator+(const Amount& other) const {
    Amount result;
    if (!BN_add(result.value_.get(), value_.get(), other.value_.get())) {
        throw std::bad_alloc();
    }
    return result;
}

Amount Amount::operator-(const Amount& other) const {
    if (*this < other) {
        throw std::domain_error("Amount subtraction would go below zero");
    }
    Amount result;
    if (!BN_sub(result.value_.get(), value_.get(), other.value_.get())) {
        throw std::bad_alloc();
    }
    return result;
}

Amount Amount::operator*(uint64_t factor) const {
    Amount result(*this);
    if (!BN_mul_word(result.value_.get(), factor)) {
        throw std::bad_alloc();
    }
    return result;
}

bool Amount::operator==(const Amount& other) const {
    return BN_cmp(value_.get(), other.value_.get()) == 0;
}

bool Amount::operator<(const Amount& other) const {
    return BN_cmp(value_.get(), other.value_.get()) < 0;
}

Coin Coin::parse(std::string_view text) {
    size_t split = 0;
    while (split < text.size() && std::isdigit(static_cast<unsigned char>(text[split]))) {
        ++split;
    }
    std::string_view denom = text.substr(split);
    if (split == 0 || !valid_denom(denom)) {
        throw malformed("Invalid coin '" + std::string(text) + "'");
    }
    return Coin{Amount::parse(text.substr(0, split)), std::string(denom)};
}

std::string Coin::to_string() const {
    return amount.to_string() + denom;
}

GasPrice GasPrice::parse(std::string_view text) {
    size_t split = 0;
    while (split < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[split])) || text[split] == '.')) {
        ++split;
    }
    std::string_view number = text.substr(0, split);
    std::string_view denom = text.substr(split);
    if (number.empty() || !valid_denom(denom)) {
        throw malformed("Invalid gas price '" + std::string(text) + "'");
    }

    GasPrice price;
    auto dot = number.find('.');
    std::string digits(number.substr(0, dot));
    if (dot != std::string_view::npos) {
        std::string_view fraction = number.substr(dot + 1);
        if (fraction.find('.') != std::string_view::npos) {
            throw malformed("Invalid gas price '" + std::string(text) + "'");
        }
        digits += fraction;
        price.scale_ = static_cast<uint32_t>(fraction.size());
    }
    price.mantissa_ = Amount::parse(digits);
    price.denom_ = std::string(denom);
    return price;
}

// fee = ceil(gas * mantissa / 10^scale)
Coin GasPrice::fee_for(uint64_t gas) const {
    Amount total = mantissa_ * gas;
    if (scale_ == 0) {
        return Coin{total, denom_};
    }

    std::string text = total.to_string();
    if (text.size() <= scale_) {
        text.insert(0, scale_ - text.size() + 1, '0');
    }
    std::string whole = text.substr(0, text.size() - scale_);
    std::string fraction = text.substr(text.size() - scale_);

    Amount fee = Amount::parse(whole);
    if (fraction.find_first_not_of('0') != std::string::npos) {
        fee = fee + Amount(1);
    }
    return Coin{fee, denom_};
}

std::string GasPrice::to_string() const {
    std::string text = mantissa_.to_string();
    if (scale_ > 0) {
        if (text.size() <= scale_) {
            text.insert(0, scale_ - text.size() + 1, '0');
        }
        text.insert(text.size() - scale_, ".");
    }
    return text + denom_;
}

} // namespace cosmkit
