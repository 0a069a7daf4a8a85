#include "domain/Decimal.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace tradebook::domain {

namespace {

using Wide = __int128;

constexpr Wide INT64_MAX_WIDE = static_cast<Wide>(std::numeric_limits<int64_t>::max());
constexpr Wide INT64_MIN_WIDE = static_cast<Wide>(std::numeric_limits<int64_t>::min());

int64_t narrow(Wide value, const char* operation) {
    if (value > INT64_MAX_WIDE || value < INT64_MIN_WIDE) {
        throw std::overflow_error(std::string("Decimal overflow in ") + operation);
    }
    return static_cast<int64_t>(value);
}

// Деление с округлением half away from zero
Wide divideRounded(Wide numerator, Wide denominator) {
    Wide quotient = numerator / denominator;
    Wide remainder = numerator % denominator;
    if (remainder != 0) {
        Wide absRemainder = remainder < 0 ? -remainder : remainder;
        Wide absDenominator = denominator < 0 ? -denominator : denominator;
        if (absRemainder * 2 >= absDenominator) {
            bool negative = (numerator < 0) != (denominator < 0);
            quotient += negative ? -1 : 1;
        }
    }
    return quotient;
}

} // namespace

Decimal::Decimal(int64_t units)
    : raw_(narrow(static_cast<Wide>(units) * SCALE, "construction")) {}

Decimal Decimal::fromRaw(int64_t raw) {
    Decimal d;
    d.raw_ = raw;
    return d;
}

Decimal Decimal::fromString(const std::string& text) {
    size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    Wide integerPart = 0;
    Wide fraction = 0;
    int fractionDigits = 0;
    bool roundUp = false;
    bool sawDigit = false;
    bool sawPoint = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (sawPoint) {
                throw std::invalid_argument("Invalid decimal: " + text);
            }
            sawPoint = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid decimal: " + text);
        }
        sawDigit = true;
        int digit = c - '0';
        if (!sawPoint) {
            integerPart = integerPart * 10 + digit;
            if (integerPart > INT64_MAX_WIDE) {
                throw std::overflow_error("Decimal overflow: " + text);
            }
        } else if (fractionDigits < FRACTION_DIGITS) {
            fraction = fraction * 10 + digit;
            ++fractionDigits;
        } else if (fractionDigits == FRACTION_DIGITS) {
            // Первая отброшенная цифра решает округление
            roundUp = digit >= 5;
            ++fractionDigits;
        }
    }

    if (!sawDigit) {
        throw std::invalid_argument("Invalid decimal: " + text);
    }

    for (int i = std::min(fractionDigits, FRACTION_DIGITS); i < FRACTION_DIGITS; ++i) {
        fraction *= 10;
    }

    Wide raw = integerPart * SCALE + fraction + (roundUp ? 1 : 0);
    return fromRaw(narrow(negative ? -raw : raw, "parse"));
}

Decimal Decimal::fromDouble(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Decimal cannot represent non-finite value");
    }
    double scaled = std::round(value * static_cast<double>(SCALE));
    if (scaled >= 9.2e18 || scaled <= -9.2e18) {
        throw std::overflow_error("Decimal overflow in fromDouble");
    }
    return fromRaw(static_cast<int64_t>(scaled));
}

double Decimal::toDouble() const {
    return static_cast<double>(raw_) / static_cast<double>(SCALE);
}

std::string Decimal::toString() const {
    Wide value = raw_;
    bool negative = value < 0;
    if (negative) {
        value = -value;
    }

    int64_t integerPart = static_cast<int64_t>(value / SCALE);
    int64_t fraction = static_cast<int64_t>(value % SCALE);

    std::string result = negative ? "-" : "";
    result += std::to_string(integerPart);

    if (fraction != 0) {
        std::string digits = std::to_string(fraction);
        digits.insert(0, FRACTION_DIGITS - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        result += "." + digits;
    }
    return result;
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? -*this : *this;
}

Decimal Decimal::mulDiv(const Decimal& multiplier, const Decimal& divisor) const {
    if (divisor.raw_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    Wide numerator = static_cast<Wide>(raw_) * multiplier.raw_;
    return fromRaw(narrow(divideRounded(numerator, divisor.raw_), "mulDiv"));
}

Decimal Decimal::operator+(const Decimal& other) const {
    int64_t result = 0;
    if (__builtin_add_overflow(raw_, other.raw_, &result)) {
        throw std::overflow_error("Decimal overflow in addition");
    }
    return fromRaw(result);
}

Decimal Decimal::operator-(const Decimal& other) const {
    int64_t result = 0;
    if (__builtin_sub_overflow(raw_, other.raw_, &result)) {
        throw std::overflow_error("Decimal overflow in subtraction");
    }
    return fromRaw(result);
}

Decimal Decimal::operator-() const {
    return fromRaw(narrow(-static_cast<Wide>(raw_), "negation"));
}

Decimal Decimal::operator*(const Decimal& other) const {
    Wide product = static_cast<Wide>(raw_) * other.raw_;
    return fromRaw(narrow(divideRounded(product, SCALE), "multiplication"));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.raw_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    Wide numerator = static_cast<Wide>(raw_) * SCALE;
    return fromRaw(narrow(divideRounded(numerator, other.raw_), "division"));
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    *this = *this - other;
    return *this;
}

} // namespace tradebook::domain
