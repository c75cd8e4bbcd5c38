/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: transaction.cpp
 * ============================================================================
 */

#include "transaction.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace ducat {

Transaction::Transaction(const Date& date, std::string description)
    : date_(date), description_(std::move(description)) {}

void Transaction::add_debit(const TransactionEntry& entry) {
    debits_.push_back(entry);
}

void Transaction::add_credit(const TransactionEntry& entry) {
    credits_.push_back(entry);
}

Money Transaction::total_debits() const {
    Money total;
    for (const auto& entry : debits_) {
        total += entry.amount;
    }
    return total;
}

Money Transaction::total_credits() const {
    Money total;
    for (const auto& entry : credits_) {
        total += entry.amount;
    }
    return total;
}

bool Transaction::is_balanced() const {
    return total_debits() == total_credits();
}

bool Transaction::has_both_sides() const {
    return !debits_.empty() && !credits_.empty();
}

void Transaction::post() {
    if (posted_) {
        throw std::logic_error("Transaction '" + description_ + "' has already been posted.");
    }
    if (!is_balanced()) {
        throw std::logic_error("Refusing to post unbalanced transaction '" + description_ + "'.");
    }

    for (const auto& entry : debits_) {
        entry.account->debit(entry.amount);
    }
    for (const auto& entry : credits_) {
        entry.account->credit(entry.amount);
    }
    posted_ = true;
}

std::string Transaction::to_string() const {
    std::stringstream ss;
    ss << "Transaction: " << date_ << " - " << description_ << "\n";
    ss << "  Debits:";
    for (const auto& entry : debits_) {
        ss << "\n    " << entry.account->name() << ": " << entry.amount;
    }
    ss << "\n  Credits:";
    for (const auto& entry : credits_) {
        ss << "\n    " << entry.account->name() << ": " << entry.amount;
    }
    return ss.str();
}

} // namespace ducat
