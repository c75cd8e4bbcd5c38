/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: date.cpp
 * ============================================================================
 */

#include "date.hpp"

#include <cctype>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace ducat {

namespace {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

int read_digits(const std::string& text, std::string::size_type pos, int count) {
    int value = 0;
    for (int i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid ISO date '" + text + "'");
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

Date::Date(int y, int m, int d) : year(y), month(m), day(d) {
    if (y < 1 || y > 9999 || m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        std::ostringstream ss;
        ss << "Invalid calendar date " << y << "-" << m << "-" << d;
        throw std::invalid_argument(ss.str());
    }
}

Date Date::parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Invalid ISO date '" + text + "', expected YYYY-MM-DD");
    }
    return Date(read_digits(text, 0, 4), read_digits(text, 5, 2), read_digits(text, 8, 2));
}

std::string Date::to_string() const {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << '-'
       << std::setw(2) << month << '-'
       << std::setw(2) << day;
    return ss.str();
}

bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) {
    return !(a == b);
}

bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}

std::ostream& operator<<(std::ostream& os, const Date& date) {
    return os << date.to_string();
}

} // namespace ducat
