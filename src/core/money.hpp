/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.hpp
 * ============================================================================
 */

#ifndef DUCAT_MONEY_HPP
#define DUCAT_MONEY_HPP

#include <cstdint>
#include <iosfwd>
#include <string>

namespace ducat {

    // money_cents: 1.00 = 100.
    // Amounts are held as integer cents so every sum and comparison is exact.
    typedef int64_t money_cents;

    /**
     * @brief Fixed-point monetary value with two fractional digits.
     */
    class Money {
    public:
        Money() : cents_(0) {}

        static Money from_cents(money_cents cents) { return Money(cents); }

        /**
         * @brief Parses a decimal string such as "1500", "-12.5" or "0.285".
         * More than two fractional digits are rounded half-up (away from zero).
         * @throws std::invalid_argument on empty, non-numeric or out-of-range text.
         */
        static Money parse(const std::string& text);

        money_cents cents() const { return cents_; }

        bool is_zero() const { return cents_ == 0; }
        bool is_negative() const { return cents_ < 0; }

        // @throws AmountOverflowError for the one value without a positive counterpart.
        Money abs() const;

        // "1234.50", "-0.07"
        std::string to_string() const;

        /**
         * Arithmetic is checked: a result outside the money_cents range throws
         * AmountOverflowError and leaves the value unchanged.
         */
        Money operator-() const;
        Money& operator+=(const Money& other);
        Money& operator-=(const Money& other);

        friend Money operator+(Money lhs, const Money& rhs) { return lhs += rhs; }
        friend Money operator-(Money lhs, const Money& rhs) { return lhs -= rhs; }

        friend bool operator==(const Money& a, const Money& b) { return a.cents_ == b.cents_; }
        friend bool operator!=(const Money& a, const Money& b) { return a.cents_ != b.cents_; }
        friend bool operator<(const Money& a, const Money& b) { return a.cents_ < b.cents_; }
        friend bool operator>(const Money& a, const Money& b) { return a.cents_ > b.cents_; }
        friend bool operator<=(const Money& a, const Money& b) { return a.cents_ <= b.cents_; }
        friend bool operator>=(const Money& a, const Money& b) { return a.cents_ >= b.cents_; }

    private:
        explicit Money(money_cents cents) : cents_(cents) {}

        money_cents cents_;
    };

    std::ostream& operator<<(std::ostream& os, const Money& money);

} // namespace ducat

#endif // DUCAT_MONEY_HPP
