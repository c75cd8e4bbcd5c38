/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: account.cpp
 * ============================================================================
 */

#include "account.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace ducat {

int debit_sign(AccountType type) {
    switch (type) {
        case AccountType::Asset:
        case AccountType::Expense:
            return 1;
        case AccountType::Liability:
        case AccountType::Equity:
        case AccountType::Revenue:
            return -1;
    }
    return 1;
}

const char* to_string(AccountType type) {
    switch (type) {
        case AccountType::Asset:     return "ASSET";
        case AccountType::Liability: return "LIABILITY";
        case AccountType::Equity:    return "EQUITY";
        case AccountType::Revenue:   return "REVENUE";
        case AccountType::Expense:   return "EXPENSE";
    }
    return "ASSET";
}

AccountType account_type_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "ASSET") return AccountType::Asset;
    if (upper == "LIABILITY") return AccountType::Liability;
    if (upper == "EQUITY") return AccountType::Equity;
    if (upper == "REVENUE") return AccountType::Revenue;
    if (upper == "EXPENSE") return AccountType::Expense;

    throw UnknownAccountTypeError("Unknown account type '" + name + "'");
}

Account::Account(std::string name, AccountType type)
    : name_(std::move(name)), type_(type) {}

void Account::debit(const Money& amount) {
    if (debit_sign(type_) > 0) {
        balance_ += amount;
    } else {
        balance_ -= amount;
    }
}

void Account::credit(const Money& amount) {
    if (debit_sign(type_) > 0) {
        balance_ -= amount;
    } else {
        balance_ += amount;
    }
}

Money Account::debit_normalized_balance() const {
    return debit_sign(type_) > 0 ? balance_ : -balance_;
}

std::string Account::to_string() const {
    return name_ + " (" + ducat::to_string(type_) + "): " + balance_.to_string();
}

} // namespace ducat
