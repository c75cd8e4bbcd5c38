/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: transaction.hpp
 * ============================================================================
 */

#ifndef DUCAT_TRANSACTION_HPP
#define DUCAT_TRANSACTION_HPP

#include <string>
#include <vector>
#include "account.hpp"
#include "date.hpp"
#include "money.hpp"

namespace ducat {

    /**
     * @brief One leg of a transaction. The amount is never negative; whether it
     * is a debit or a credit depends on which list of the Transaction holds it.
     */
    struct TransactionEntry {
        Account* account;
        Money amount;

        TransactionEntry(Account& acc, const Money& amt) : account(&acc), amount(amt) {}
    };

    class Transaction {
    public:
        Transaction(const Date& date, std::string description);

        void add_debit(const TransactionEntry& entry);
        void add_credit(const TransactionEntry& entry);

        /**
         * is_balanced
         * Exact comparison of the debit total against the credit total.
         */
        bool is_balanced() const;

        // False when either the debit or the credit list is empty.
        bool has_both_sides() const;

        Money total_debits() const;
        Money total_credits() const;

        /**
         * post
         * Applies every debit, then every credit, to the referenced accounts in
         * entry order. The Ledger validates before calling this.
         * @throws std::logic_error if already posted or not balanced.
         */
        void post();

        bool is_posted() const { return posted_; }

        const Date& date() const { return date_; }
        const std::string& description() const { return description_; }
        const std::vector<TransactionEntry>& debits() const { return debits_; }
        const std::vector<TransactionEntry>& credits() const { return credits_; }

        std::string to_string() const;

    private:
        Date date_;
        std::string description_;
        std::vector<TransactionEntry> debits_;
        std::vector<TransactionEntry> credits_;
        bool posted_ = false;
    };

} // namespace ducat

#endif // DUCAT_TRANSACTION_HPP
