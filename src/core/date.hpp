/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: date.hpp
 * ============================================================================
 */

#ifndef DUCAT_DATE_HPP
#define DUCAT_DATE_HPP

#include <iosfwd>
#include <string>

namespace ducat {

    /**
     * @brief Calendar date of a transaction (proleptic Gregorian, years 1-9999).
     */
    struct Date {
        int year = 1970;
        int month = 1;
        int day = 1;

        Date() = default;

        // @throws std::invalid_argument if the fields do not name a real day.
        Date(int y, int m, int d);

        /**
         * @brief Parses an ISO-8601 calendar date, exactly "YYYY-MM-DD".
         * @throws std::invalid_argument for any other shape or an impossible day.
         */
        static Date parse(const std::string& text);

        std::string to_string() const;
    };

    bool operator==(const Date& a, const Date& b);
    bool operator!=(const Date& a, const Date& b);
    bool operator<(const Date& a, const Date& b);

    std::ostream& operator<<(std::ostream& os, const Date& date);

} // namespace ducat

#endif // DUCAT_DATE_HPP
