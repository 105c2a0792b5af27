// src/core/types.cpp

#include "rebalance_ngin/core/types.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace rebalance_ngin {

namespace {

using int128 = __int128;

int64_t narrow(int128 value) {
    if (value > static_cast<int128>(std::numeric_limits<int64_t>::max()) ||
        value < static_cast<int128>(std::numeric_limits<int64_t>::min())) {
        throw std::overflow_error("Decimal overflow");
    }
    return static_cast<int64_t>(value);
}

// Integer division rounding half away from zero
int128 divide_rounded(int128 numerator, int128 denominator) {
    int128 quotient = numerator / denominator;
    int128 remainder = numerator % denominator;
    if (remainder < 0) {
        remainder = -remainder;
    }
    int128 abs_denominator = denominator < 0 ? -denominator : denominator;

    if (2 * remainder >= abs_denominator) {
        bool negative = (numerator < 0) != (denominator < 0);
        quotient += negative ? -1 : 1;
    }
    return quotient;
}

}  // namespace

Decimal::Decimal(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Decimal cannot represent a non-finite value");
    }
    double scaled = std::round(value * static_cast<double>(SCALE));
    if (scaled > static_cast<double>(std::numeric_limits<int64_t>::max()) ||
        scaled < static_cast<double>(std::numeric_limits<int64_t>::min())) {
        throw std::overflow_error("Decimal overflow");
    }
    value_ = static_cast<int64_t>(scaled);
}

Decimal Decimal::operator+(const Decimal& other) const {
    return from_raw(narrow(static_cast<int128>(value_) + other.value_));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return from_raw(narrow(static_cast<int128>(value_) - other.value_));
}

Decimal Decimal::operator*(const Decimal& other) const {
    int128 product = static_cast<int128>(value_) * other.value_;
    return from_raw(narrow(divide_rounded(product, SCALE)));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.value_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    int128 numerator = static_cast<int128>(value_) * SCALE;
    return from_raw(narrow(divide_rounded(numerator, other.value_)));
}

std::string Decimal::to_string() const {
    // Magnitude in unsigned arithmetic so INT64_MIN formats correctly
    uint64_t magnitude = value_ < 0 ? static_cast<uint64_t>(-(value_ + 1)) + 1
                                    : static_cast<uint64_t>(value_);
    uint64_t integer_part = magnitude / SCALE;
    uint64_t fraction_part = magnitude % SCALE;

    std::string result = value_ < 0 ? "-" : "";
    result += std::to_string(integer_part);

    if (fraction_part != 0) {
        std::string fraction = std::to_string(fraction_part);
        fraction.insert(0, SCALE_DIGITS - fraction.size(), '0');
        while (!fraction.empty() && fraction.back() == '0') {
            fraction.pop_back();
        }
        result += "." + fraction;
    }

    return result;
}

Result<Decimal> Decimal::parse(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }

    const std::string invalid = "Invalid decimal value: \"" + text + "\"";
    if (begin == end) {
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR, invalid, "Decimal");
    }

    bool negative = false;
    if (text[begin] == '-' || text[begin] == '+') {
        negative = text[begin] == '-';
        ++begin;
    }

    int128 integer_part = 0;
    int128 fraction_part = 0;
    int fraction_digits = 0;
    int integer_digits = 0;
    bool seen_point = false;

    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c == '.') {
            if (seen_point) {
                return make_error<Decimal>(ErrorCode::CONVERSION_ERROR, invalid, "Decimal");
            }
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return make_error<Decimal>(ErrorCode::CONVERSION_ERROR, invalid, "Decimal");
        }

        int digit = c - '0';
        if (seen_point) {
            if (++fraction_digits > SCALE_DIGITS) {
                return make_error<Decimal>(
                    ErrorCode::CONVERSION_ERROR,
                    invalid + ": more than " + std::to_string(SCALE_DIGITS) + " fractional digits",
                    "Decimal");
            }
            fraction_part = fraction_part * 10 + digit;
        } else {
            if (++integer_digits > 18) {
                return make_error<Decimal>(ErrorCode::CONVERSION_ERROR, invalid + ": too large",
                                           "Decimal");
            }
            integer_part = integer_part * 10 + digit;
        }
    }

    if (integer_digits == 0 && fraction_digits == 0) {
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR, invalid, "Decimal");
    }

    for (int i = fraction_digits; i < SCALE_DIGITS; ++i) {
        fraction_part *= 10;
    }

    int128 raw = integer_part * SCALE + fraction_part;
    if (negative) {
        raw = -raw;
    }

    try {
        return Decimal::from_raw(narrow(raw));
    } catch (const std::overflow_error&) {
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR, invalid + ": too large",
                                   "Decimal");
    }
}

Result<Decimal> parse_decimal(const std::string& text, DecimalRestrictions restrictions) {
    auto parsed = Decimal::parse(text);
    if (parsed.is_error()) {
        return parsed;
    }

    const Decimal& value = parsed.value();
    switch (restrictions) {
        case DecimalRestrictions::NON_NEGATIVE:
            if (value.is_negative()) {
                return make_error<Decimal>(ErrorCode::INVALID_DATA,
                                           "Value must not be negative: " + text, "Decimal");
            }
            break;
        case DecimalRestrictions::STRICTLY_POSITIVE:
            if (!value.is_positive()) {
                return make_error<Decimal>(ErrorCode::INVALID_DATA,
                                           "Value must be positive: " + text, "Decimal");
            }
            break;
        case DecimalRestrictions::NO:
            break;
    }

    return parsed;
}

}  // namespace rebalance_ngin
