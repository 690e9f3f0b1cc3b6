#include "domain/Decimal.hpp"
#include "domain/LedgerErrors.hpp"

#include <cctype>
#include <limits>
#include <sstream>
#include <iomanip>

namespace corebank::domain {

namespace {

using Wide = __int128;

constexpr int64_t POW10[] = {
    1LL,
    10LL,
    100LL,
    1000LL,
    10000LL,
    100000LL,
    1000000LL,
    10000000LL,
    100000000LL
};

void checkScale(int scale) {
    if (scale < 0 || scale > Decimal::SCALE) {
        throw ValidationException("Decimal scale out of range: " + std::to_string(scale));
    }
}

int64_t narrow(Wide value) {
    if (value > std::numeric_limits<int64_t>::max() || value < std::numeric_limits<int64_t>::min()) {
        throw ValidationException("Decimal overflow");
    }
    return static_cast<int64_t>(value);
}

// Деление с округлением half-up (от нуля), den > 0
Wide roundDiv(Wide num, Wide den) {
    Wide quotient = num / den;
    Wide remainder = num % den;
    if (remainder < 0) {
        remainder = -remainder;
    }
    if (remainder * 2 >= den) {
        quotient += (num < 0) ? -1 : 1;
    }
    return quotient;
}

} // namespace

Decimal Decimal::fromRaw(int64_t raw) {
    return Decimal(raw);
}

Decimal Decimal::fromInt(int64_t units) {
    return Decimal(narrow(static_cast<Wide>(units) * ONE));
}

Decimal Decimal::fromMinorUnits(int64_t minorUnits, int scale) {
    checkScale(scale);
    return Decimal(narrow(static_cast<Wide>(minorUnits) * POW10[SCALE - scale]));
}

Decimal Decimal::parse(const std::string& text) {
    size_t pos = 0;
    size_t end = text.size();
    while (pos < end && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    bool negative = false;
    if (pos < end && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    Wide integerPart = 0;
    Wide fraction = 0;
    int fractionDigits = 0;
    int integerDigits = 0;
    bool seenPoint = false;

    for (; pos < end; ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seenPoint) {
                throw ValidationException("Malformed decimal: '" + text + "'");
            }
            seenPoint = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ValidationException("Malformed decimal: '" + text + "'");
        }
        int digit = c - '0';
        if (seenPoint) {
            if (++fractionDigits > SCALE) {
                throw ValidationException("Too many fractional digits: '" + text + "'");
            }
            fraction = fraction * 10 + digit;
        } else {
            ++integerDigits;
            integerPart = integerPart * 10 + digit;
            if (integerPart > std::numeric_limits<int64_t>::max()) {
                throw ValidationException("Decimal overflow: '" + text + "'");
            }
        }
    }

    if (integerDigits == 0 && fractionDigits == 0) {
        throw ValidationException("Malformed decimal: '" + text + "'");
    }

    Wide raw = integerPart * ONE + fraction * POW10[SCALE - fractionDigits];
    return Decimal(narrow(negative ? -raw : raw));
}

int64_t Decimal::toMinorUnits(int scale) const {
    checkScale(scale);
    return narrow(roundDiv(raw_, POW10[SCALE - scale]));
}

Decimal Decimal::quantize(int scale) const {
    checkScale(scale);
    return Decimal(narrow(static_cast<Wide>(toMinorUnits(scale)) * POW10[SCALE - scale]));
}

std::string Decimal::toString(int scale) const {
    Wide minor = toMinorUnits(scale);
    bool negative = minor < 0;
    if (negative) {
        minor = -minor;
    }

    Wide integerPart = minor / POW10[scale];
    int64_t fraction = static_cast<int64_t>(minor % POW10[scale]);

    std::ostringstream ss;
    if (negative) {
        ss << '-';
    }
    ss << static_cast<uint64_t>(integerPart);
    if (scale > 0) {
        ss << '.' << std::setw(scale) << std::setfill('0') << fraction;
    }
    return ss.str();
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? -*this : *this;
}

Decimal Decimal::multiply(const Decimal& a, const Decimal& b) {
    Wide product = static_cast<Wide>(a.raw_) * b.raw_;
    return Decimal(narrow(roundDiv(product, ONE)));
}

Decimal Decimal::divide(const Decimal& a, const Decimal& b) {
    if (b.raw_ == 0) {
        throw ValidationException("Division by zero");
    }
    Wide numerator = static_cast<Wide>(a.raw_) * ONE;
    Wide denominator = b.raw_;
    if (denominator < 0) {
        numerator = -numerator;
        denominator = -denominator;
    }
    return Decimal(narrow(roundDiv(numerator, denominator)));
}

Decimal Decimal::operator+(const Decimal& other) const {
    return Decimal(narrow(static_cast<Wide>(raw_) + other.raw_));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return Decimal(narrow(static_cast<Wide>(raw_) - other.raw_));
}

Decimal Decimal::operator-() const {
    return Decimal(narrow(-static_cast<Wide>(raw_)));
}

} // namespace corebank::domain
