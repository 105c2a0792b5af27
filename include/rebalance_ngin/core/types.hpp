// include/rebalance_ngin/core/types.hpp

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include "rebalance_ngin/core/error.hpp"

namespace rebalance_ngin {

/**
 * @brief Exact fixed-point decimal number
 *
 * Stores values as a 64-bit integer scaled by 10^8. Addition and subtraction
 * are exact; multiplication and division use 128-bit intermediates and round
 * half away from zero at the 8th fractional digit. The representable range
 * is about +/-9.2 * 10^10. Overflow throws std::overflow_error, division by
 * zero throws std::domain_error.
 */
class Decimal {
public:
    static constexpr int SCALE_DIGITS = 8;
    static constexpr int64_t SCALE = 100000000;

    Decimal() : value_(0) {}
    Decimal(int value) : value_(static_cast<int64_t>(value) * SCALE) {}
    explicit Decimal(double value);

    /**
     * @brief Create a decimal from its scaled integer representation
     * @param raw Value multiplied by SCALE
     */
    static Decimal from_raw(int64_t raw) {
        Decimal d;
        d.value_ = raw;
        return d;
    }

    /**
     * @brief Parse a plain decimal string ("-12.345")
     * @param text String to parse, surrounding whitespace is ignored
     * @return Result containing the value or a CONVERSION_ERROR
     */
    static Result<Decimal> parse(const std::string& text);

    int64_t raw() const {
        return value_;
    }

    bool is_zero() const {
        return value_ == 0;
    }
    bool is_negative() const {
        return value_ < 0;
    }
    bool is_positive() const {
        return value_ > 0;
    }

    Decimal abs() const {
        return value_ < 0 ? from_raw(-value_) : *this;
    }

    explicit operator double() const {
        return static_cast<double>(value_) / static_cast<double>(SCALE);
    }

    /**
     * @brief Format without trailing fractional zeros ("500", "0.3")
     */
    std::string to_string() const;

    Decimal operator-() const {
        return from_raw(-value_);
    }

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;
    Decimal operator/(const Decimal& other) const;

    Decimal& operator+=(const Decimal& other) {
        *this = *this + other;
        return *this;
    }
    Decimal& operator-=(const Decimal& other) {
        *this = *this - other;
        return *this;
    }
    Decimal& operator*=(const Decimal& other) {
        *this = *this * other;
        return *this;
    }
    Decimal& operator/=(const Decimal& other) {
        *this = *this / other;
        return *this;
    }

    bool operator==(const Decimal& other) const {
        return value_ == other.value_;
    }
    bool operator!=(const Decimal& other) const {
        return value_ != other.value_;
    }
    bool operator<(const Decimal& other) const {
        return value_ < other.value_;
    }
    bool operator<=(const Decimal& other) const {
        return value_ <= other.value_;
    }
    bool operator>(const Decimal& other) const {
        return value_ > other.value_;
    }
    bool operator>=(const Decimal& other) const {
        return value_ >= other.value_;
    }

private:
    int64_t value_;
};

inline std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

inline Decimal min(const Decimal& a, const Decimal& b) {
    return b < a ? b : a;
}

inline Decimal max(const Decimal& a, const Decimal& b) {
    return a < b ? b : a;
}

/**
 * @brief Price type, exact decimal in the reporting currency
 */
using Price = Decimal;

/**
 * @brief Quantity type for holdings, fractional quantities allowed
 */
using Quantity = Decimal;

/**
 * @brief Monetary amount in the reporting currency
 */
using Amount = Decimal;

/**
 * @brief Sign restrictions applied when parsing user supplied decimals
 */
enum class DecimalRestrictions {
    NO,
    NON_NEGATIVE,
    STRICTLY_POSITIVE
};

/**
 * @brief Parse a decimal and check it against a sign restriction
 * @param text String to parse
 * @param restrictions Allowed sign of the value
 * @return Result containing the value, INVALID_DATA if the restriction fails
 */
Result<Decimal> parse_decimal(const std::string& text, DecimalRestrictions restrictions);

}  // namespace rebalance_ngin
