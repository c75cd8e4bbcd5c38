/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ledger.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The Ledger owns the chart of accounts and the transaction log. Every
 * balance change in the system goes through record_transaction() or post(),
 * both of which validate the whole transaction before touching any account.
 * ============================================================================
 */

#ifndef DUCAT_LEDGER_HPP
#define DUCAT_LEDGER_HPP

#include <initializer_list>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "account.hpp"
#include "date.hpp"
#include "money.hpp"
#include "reports.hpp"
#include "transaction.hpp"

namespace ducat {

    /**
     * @brief A signed line handed to Ledger::record_transaction.
     *
     * A non-negative amount increases the account and a negative amount
     * decreases it, whatever the account's category. The Ledger translates
     * that into a debit or a credit.
     */
    struct LedgerLine {
        Account* account;
        Money amount;

        LedgerLine(Account& acc, const Money& amt) : account(&acc), amount(amt) {}
        LedgerLine(Account& acc, const std::string& amt) : account(&acc), amount(Money::parse(amt)) {}
        LedgerLine(Account& acc, const char* amt) : account(&acc), amount(Money::parse(amt)) {}
    };

    class Ledger {
    public:
        explicit Ledger(std::string name);

        Ledger(const Ledger&) = delete;
        Ledger& operator=(const Ledger&) = delete;
        Ledger(Ledger&&) = default;
        Ledger& operator=(Ledger&&) = default;

        const std::string& name() const { return name_; }

        /**
         * create_account
         * Appends a new account to the chart of accounts.
         * @throws DuplicateAccountError if the name is already taken.
         */
        Account& create_account(const std::string& name, AccountType type);

        /**
         * get_or_create_account
         * Returns the account with this exact name, or creates it with the given
         * type. An existing account keeps its type; a mismatch is logged.
         */
        Account& get_or_create_account(const std::string& name, AccountType type);

        Account* find_account(const std::string& name);
        const Account* find_account(const std::string& name) const;

        /**
         * record_transaction
         * Routes each signed line to the debit or credit side, validates the
         * result and posts it.
         * @throws UnbalancedTransactionError if debits and credits differ or a side
         * is empty. Nothing is changed in that case.
         * @return The transaction as stored in the log (valid until the next post).
         */
        const Transaction& record_transaction(const Date& date,
                                              const std::string& description,
                                              std::initializer_list<LedgerLine> lines);
        const Transaction& record_transaction(const Date& date,
                                              const std::string& description,
                                              const std::vector<LedgerLine>& lines);

        /**
         * post
         * Validates an already routed transaction, posts it and appends it to the
         * log. This is the shared gateway used by record_transaction and import.
         */
        const Transaction& post(Transaction transaction);

        // Throws the error post() would raise, without changing anything.
        void validate_transaction(const Transaction& transaction) const;

        /**
         * debit_normalized_total
         * Sum of every account balance with debits positive. Zero whenever the
         * books are consistent.
         */
        Money debit_normalized_total() const;

        const std::vector<std::unique_ptr<Account>>& accounts() const { return accounts_; }
        const std::vector<Transaction>& transactions() const { return transactions_; }

        TrialBalance trial_balance() const;
        BalanceSheet balance_sheet() const;
        IncomeStatement income_statement() const;

        void print_trial_balance(std::ostream& out = std::cout) const;
        void print_balance_sheet(std::ostream& out = std::cout) const;
        void print_income_statement(std::ostream& out = std::cout) const;

    private:
        bool owns(const Account* account) const;
        std::vector<StatementLine> statement_lines(AccountType type, Money& total) const;

        std::string name_;
        std::vector<std::unique_ptr<Account>> accounts_;
        std::map<std::string, Account*> index_;
        std::vector<Transaction> transactions_;
    };

} // namespace ducat

#endif // DUCAT_LEDGER_HPP
