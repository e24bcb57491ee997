// src/core/decimal.cpp

#include "tax_ngin/core/decimal.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tax_ngin {

namespace {

using wide_t = __int128;

constexpr int64_t kPow10[] = {1, 10, 100, 1000, 10000, 100000};

int64_t narrow_or_throw(wide_t value, const char* operation) {
    if (value > static_cast<wide_t>(std::numeric_limits<int64_t>::max()) ||
        value < static_cast<wide_t>(std::numeric_limits<int64_t>::min())) {
        throw std::overflow_error(std::string("Decimal overflow in ") + operation);
    }
    return static_cast<int64_t>(value);
}

// Divide rounding ties away from zero
wide_t divide_half_up(wide_t numerator, wide_t denominator) {
    wide_t quotient = numerator / denominator;
    wide_t remainder = numerator % denominator;
    if (remainder < 0) {
        remainder = -remainder;
    }
    wide_t abs_den = denominator < 0 ? -denominator : denominator;
    if (remainder * 2 >= abs_den) {
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
    long double scaled = static_cast<long double>(value) * SCALE;
    if (scaled > static_cast<long double>(std::numeric_limits<int64_t>::max()) ||
        scaled < static_cast<long double>(std::numeric_limits<int64_t>::min())) {
        throw std::overflow_error("Decimal overflow converting from double");
    }
    value_ = static_cast<int64_t>(std::llround(scaled));
}

Decimal Decimal::from_int(int64_t units) {
    return Decimal::from_raw(narrow_or_throw(static_cast<wide_t>(units) * SCALE, "from_int"));
}

Result<Decimal> Decimal::from_string(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }

    if (begin == end) {
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR, "Empty decimal value",
                                   "Decimal");
    }

    bool negative = false;
    if (text[begin] == '+' || text[begin] == '-') {
        negative = text[begin] == '-';
        ++begin;
    }

    wide_t whole = 0;
    wide_t fraction = 0;
    int fraction_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;
    int round_digit = -1;

    for (size_t i = begin; i < end; ++i) {
        char c = text[i];
        if (c == '.') {
            if (seen_point) {
                return make_error<Decimal>(ErrorCode::CONVERSION_ERROR,
                                           "Invalid decimal value: " + text, "Decimal");
            }
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return make_error<Decimal>(ErrorCode::CONVERSION_ERROR,
                                       "Invalid decimal value: " + text, "Decimal");
        }
        seen_digit = true;
        int digit = c - '0';
        if (!seen_point) {
            whole = whole * 10 + digit;
            if (whole > static_cast<wide_t>(std::numeric_limits<int64_t>::max() / SCALE)) {
                return make_error<Decimal>(ErrorCode::CONVERSION_ERROR,
                                           "Decimal value out of range: " + text, "Decimal");
            }
        } else if (fraction_digits < SCALE_DIGITS) {
            fraction = fraction * 10 + digit;
            ++fraction_digits;
        } else if (round_digit < 0) {
            round_digit = digit;
        }
    }

    if (!seen_digit) {
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR, "Invalid decimal value: " + text,
                                   "Decimal");
    }

    while (fraction_digits < SCALE_DIGITS) {
        fraction *= 10;
        ++fraction_digits;
    }

    wide_t raw = whole * SCALE + fraction;
    if (round_digit >= 5) {
        raw += 1;
    }
    if (negative) {
        raw = -raw;
    }

    try {
        return Decimal::from_raw(narrow_or_throw(raw, "from_string"));
    } catch (const std::overflow_error& e) {
        return make_error<Decimal>(ErrorCode::CONVERSION_ERROR,
                                   std::string(e.what()) + ": " + text, "Decimal");
    }
}

Decimal Decimal::round(int places, RoundingMode mode) const {
    if (places < 0 || places > SCALE_DIGITS) {
        throw std::invalid_argument("Decimal::round places must be between 0 and " +
                                    std::to_string(SCALE_DIGITS));
    }
    if (places == SCALE_DIGITS) {
        return *this;
    }

    const int64_t factor = kPow10[SCALE_DIGITS - places];
    wide_t quotient = mode == RoundingMode::HALF_UP ? divide_half_up(value_, factor)
                                                    : static_cast<wide_t>(value_ / factor);
    return Decimal::from_raw(narrow_or_throw(quotient * factor, "round"));
}

int64_t Decimal::truncated_quotient(const Decimal& divisor) const {
    if (!divisor.is_positive()) {
        throw std::invalid_argument("Decimal::truncated_quotient requires a positive divisor");
    }
    if (is_negative()) {
        throw std::invalid_argument("Decimal::truncated_quotient requires a non-negative dividend");
    }
    return value_ / divisor.value_;
}

std::string Decimal::to_string(int places) const {
    const Decimal rounded = round(places);
    const wide_t raw = rounded.value_;
    const wide_t magnitude = raw < 0 ? -raw : raw;

    const int64_t whole = static_cast<int64_t>(magnitude / SCALE);
    std::string out = (raw < 0 ? "-" : "") + std::to_string(whole);

    if (places > 0) {
        int64_t fraction =
            static_cast<int64_t>(magnitude % SCALE) / kPow10[SCALE_DIGITS - places];
        std::string digits = std::to_string(fraction);
        out += "." + std::string(static_cast<size_t>(places) - digits.size(), '0') + digits;
    }
    return out;
}

Decimal& Decimal::operator+=(const Decimal& other) {
    value_ = narrow_or_throw(static_cast<wide_t>(value_) + other.value_, "addition");
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    value_ = narrow_or_throw(static_cast<wide_t>(value_) - other.value_, "subtraction");
    return *this;
}

Decimal& Decimal::operator*=(const Decimal& other) {
    wide_t product = static_cast<wide_t>(value_) * other.value_;
    value_ = narrow_or_throw(divide_half_up(product, SCALE), "multiplication");
    return *this;
}

Decimal& Decimal::operator/=(const Decimal& other) {
    if (other.value_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    // Truncated at the fifth digit so a later half-up round() stays exact
    wide_t numerator = static_cast<wide_t>(value_) * SCALE;
    value_ = narrow_or_throw(numerator / other.value_, "division");
    return *this;
}

Decimal operator*(const Decimal& lhs, int64_t count) {
    return Decimal::from_raw(
        narrow_or_throw(static_cast<wide_t>(lhs.value_) * count, "multiplication"));
}

}  // namespace tax_ngin
