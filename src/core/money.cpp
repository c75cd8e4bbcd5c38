/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.cpp
 * ============================================================================
 */

#include "money.hpp"
#include "errors.hpp"

#include <cctype>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace ducat {

namespace {

const money_cents kMaxWhole = (std::numeric_limits<money_cents>::max() - 100) / 100;

const money_cents kMaxCents = std::numeric_limits<money_cents>::max();
const money_cents kMinCents = std::numeric_limits<money_cents>::min();

AmountOverflowError out_of_range(money_cents a, char op, money_cents b) {
    return AmountOverflowError("Amount overflow: " + Money::from_cents(a).to_string() + " " + op + " "
                               + Money::from_cents(b).to_string() + " is out of range.");
}

std::invalid_argument bad_amount(const std::string& text, const std::string& why) {
    return std::invalid_argument("Invalid monetary amount '" + text + "': " + why);
}

} // namespace

// ----------------------------------------------------------------------------
// parse
// Accepts [+-]digits[.digits] with surrounding whitespace. At least one digit
// is required on one side of the decimal point.
// ----------------------------------------------------------------------------
Money Money::parse(const std::string& text) {
    std::string::size_type pos = 0;
    std::string::size_type end = text.size();

    while (pos < end && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    if (pos == end) {
        throw bad_amount(text, "empty");
    }

    bool negative = false;
    if (text[pos] == '+' || text[pos] == '-') {
        negative = text[pos] == '-';
        ++pos;
    }

    money_cents whole = 0;
    int whole_digits = 0;
    while (pos < end && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (whole > kMaxWhole / 10) {
            throw bad_amount(text, "out of range");
        }
        whole = whole * 10 + (text[pos] - '0');
        if (whole > kMaxWhole) {
            throw bad_amount(text, "out of range");
        }
        ++whole_digits;
        ++pos;
    }

    money_cents fraction = 0;
    int fraction_digits = 0;
    bool round_up = false;
    if (pos < end && text[pos] == '.') {
        ++pos;
        while (pos < end && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            int digit = text[pos] - '0';
            if (fraction_digits < 2) {
                fraction = fraction * 10 + digit;
            } else if (fraction_digits == 2) {
                round_up = digit >= 5;
            }
            ++fraction_digits;
            ++pos;
        }
    }

    if (pos != end) {
        throw bad_amount(text, "unexpected character");
    }
    if (whole_digits == 0 && fraction_digits == 0) {
        throw bad_amount(text, "no digits");
    }

    if (fraction_digits == 1) {
        fraction *= 10;
    }

    money_cents cents = whole * 100 + fraction + (round_up ? 1 : 0);
    return Money(negative ? -cents : cents);
}

Money Money::abs() const {
    return cents_ < 0 ? -*this : *this;
}

Money Money::operator-() const {
    if (cents_ == kMinCents) {
        throw AmountOverflowError("Amount overflow: cannot negate " + to_string() + ".");
    }
    return Money(-cents_);
}

Money& Money::operator+=(const Money& other) {
    if ((other.cents_ > 0 && cents_ > kMaxCents - other.cents_) ||
        (other.cents_ < 0 && cents_ < kMinCents - other.cents_)) {
        throw out_of_range(cents_, '+', other.cents_);
    }
    cents_ += other.cents_;
    return *this;
}

Money& Money::operator-=(const Money& other) {
    if ((other.cents_ < 0 && cents_ > kMaxCents + other.cents_) ||
        (other.cents_ > 0 && cents_ < kMinCents + other.cents_)) {
        throw out_of_range(cents_, '-', other.cents_);
    }
    cents_ -= other.cents_;
    return *this;
}

std::string Money::to_string() const {
    // Work on the magnitude as unsigned so the most negative value still formats.
    uint64_t magnitude = cents_ < 0 ? 0 - static_cast<uint64_t>(cents_) : static_cast<uint64_t>(cents_);
    uint64_t units = magnitude / 100;
    uint64_t cents = magnitude % 100;

    std::string out = cents_ < 0 ? "-" : "";
    out += std::to_string(units);
    out += '.';
    out += static_cast<char>('0' + cents / 10);
    out += static_cast<char>('0' + cents % 10);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.to_string();
}

} // namespace ducat
