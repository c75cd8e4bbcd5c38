/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: account.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The five account categories and the balance holder that applies debits
 * and credits according to its category.
 *
 *   Assets, Expenses:                increased by debits, decreased by credits
 *   Liabilities, Equity, Revenue:    increased by credits, decreased by debits
 * ============================================================================
 */

#ifndef DUCAT_ACCOUNT_HPP
#define DUCAT_ACCOUNT_HPP

#include <string>
#include "money.hpp"

namespace ducat {

    enum class AccountType {
        Asset,
        Liability,
        Equity,
        Revenue,
        Expense
    };

    /**
     * debit_sign
     * +1 when a debit increases the balance (Asset, Expense), -1 otherwise.
     */
    int debit_sign(AccountType type);

    // Wire names: "ASSET", "LIABILITY", "EQUITY", "REVENUE", "EXPENSE".
    const char* to_string(AccountType type);

    /**
     * @brief Maps a wire name back to its category. Case-insensitive.
     * @throws UnknownAccountTypeError for anything outside the five categories.
     */
    AccountType account_type_from_string(const std::string& name);

    class Account {
    public:
        Account(std::string name, AccountType type);

        Account(const Account&) = delete;
        Account& operator=(const Account&) = delete;

        const std::string& name() const { return name_; }
        AccountType type() const { return type_; }
        const Money& balance() const { return balance_; }

        // Amounts are expected to be non-negative; the side carries the sign.
        void debit(const Money& amount);
        void credit(const Money& amount);

        /**
         * debit_normalized_balance
         * The balance expressed with debits positive. Summed over a ledger this
         * is always zero.
         */
        Money debit_normalized_balance() const;

        std::string to_string() const;

    private:
        std::string name_;
        AccountType type_;
        Money balance_;
    };

} // namespace ducat

#endif // DUCAT_ACCOUNT_HPP
