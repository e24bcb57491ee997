// include/tax_ngin/core/decimal.hpp

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include "tax_ngin/core/error.hpp"

namespace tax_ngin {

/**
 * @brief Rounding modes supported by Decimal::round
 */
enum class RoundingMode {
    HALF_UP,  // Ties away from zero
    DOWN      // Truncate toward zero
};

/**
 * @brief Fixed-point decimal for monetary arithmetic
 *
 * Stores the value as a signed 64-bit integer scaled by 10^5, so every
 * amount with up to five fractional digits is represented exactly.
 * Products and quotients go through 128-bit intermediates and throw
 * std::overflow_error when the result leaves the representable range
 * (roughly +/- 92,233,720,368,547.75807).
 */
class Decimal {
public:
    static constexpr int SCALE_DIGITS = 5;
    static constexpr int64_t SCALE = 100000;

    Decimal() : value_(0) {}

    /**
     * @brief Construct from a double, rounded half-up at the fifth digit
     * Intended for configuration values, not for ledger data
     */
    explicit Decimal(double value);

    /**
     * @brief Construct a whole-number amount
     */
    static Decimal from_int(int64_t units);

    /**
     * @brief Construct from the raw scaled representation
     */
    static Decimal from_raw(int64_t raw) {
        Decimal d;
        d.value_ = raw;
        return d;
    }

    /**
     * @brief Parse a decimal literal exactly
     *
     * Accepts an optional sign, digits, and an optional fraction. Digits past
     * the fifth are rounded half-up. Surrounding whitespace is ignored.
     *
     * @param text Text to parse, e.g. "-1234.50"
     * @return Parsed value or CONVERSION_ERROR
     */
    static Result<Decimal> from_string(const std::string& text);

    int64_t raw() const {
        return value_;
    }

    explicit operator double() const {
        return static_cast<double>(value_) / static_cast<double>(SCALE);
    }

    /**
     * @brief Round to the given number of fractional digits
     * @param places Digits to keep, 0 to SCALE_DIGITS
     * @param mode HALF_UP rounds ties away from zero, DOWN truncates
     */
    Decimal round(int places = 2, RoundingMode mode = RoundingMode::HALF_UP) const;

    /**
     * @brief Whole number of times the divisor fits into this amount
     *
     * Both operands must be non-negative and the divisor non-zero. The
     * quotient is truncated, never rounded.
     */
    int64_t truncated_quotient(const Decimal& divisor) const;

    Decimal abs() const {
        return value_ < 0 ? Decimal::from_raw(-value_) : *this;
    }

    bool is_negative() const {
        return value_ < 0;
    }

    bool is_positive() const {
        return value_ > 0;
    }

    bool is_zero() const {
        return value_ == 0;
    }

    /**
     * @brief Render with a fixed number of fractional digits (half-up)
     */
    std::string to_string(int places = 2) const;

    Decimal operator-() const {
        return Decimal::from_raw(-value_);
    }

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);
    Decimal& operator*=(const Decimal& other);
    Decimal& operator/=(const Decimal& other);

    friend Decimal operator+(Decimal lhs, const Decimal& rhs) {
        return lhs += rhs;
    }
    friend Decimal operator-(Decimal lhs, const Decimal& rhs) {
        return lhs -= rhs;
    }
    friend Decimal operator*(Decimal lhs, const Decimal& rhs) {
        return lhs *= rhs;
    }
    friend Decimal operator/(Decimal lhs, const Decimal& rhs) {
        return lhs /= rhs;
    }

    /**
     * @brief Exact product with an integer count, e.g. quantity * price
     */
    friend Decimal operator*(const Decimal& lhs, int64_t count);

    friend bool operator==(const Decimal& a, const Decimal& b) {
        return a.value_ == b.value_;
    }
    friend bool operator!=(const Decimal& a, const Decimal& b) {
        return a.value_ != b.value_;
    }
    friend bool operator<(const Decimal& a, const Decimal& b) {
        return a.value_ < b.value_;
    }
    friend bool operator<=(const Decimal& a, const Decimal& b) {
        return a.value_ <= b.value_;
    }
    friend bool operator>(const Decimal& a, const Decimal& b) {
        return a.value_ > b.value_;
    }
    friend bool operator>=(const Decimal& a, const Decimal& b) {
        return a.value_ >= b.value_;
    }

    // Prints at least two fractional digits, trailing zeros beyond that trimmed
    friend std::ostream& operator<<(std::ostream& os, const Decimal& d) {
        std::string text = d.to_string(SCALE_DIGITS);
        size_t keep = text.find('.') + 3;
        while (text.size() > keep && text.back() == '0') {
            text.pop_back();
        }
        return os << text;
    }

private:
    int64_t value_;
};

}  // namespace tax_ngin
