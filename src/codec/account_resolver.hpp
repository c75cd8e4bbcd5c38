/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: account_resolver.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Maps free-text account names from flat CSV records onto the ledger's
 * chart of accounts. The CSV format carries no account type, so a missing
 * account is created with a type guessed from keywords in its name. JSON
 * records carry the type and never come through here.
 * ============================================================================
 */

#ifndef DUCAT_ACCOUNT_RESOLVER_HPP
#define DUCAT_ACCOUNT_RESOLVER_HPP

#include <string>
#include "../core/account.hpp"
#include "../core/ledger.hpp"

namespace ducat {
namespace codec {

    /**
     * @brief Guesses an account category from its name.
     *
     * The lower-cased name is checked against each category's keywords in
     * this order, and the first category with a match wins:
     *
     *   Asset      cash, receivable, inventory, land, building, equipment, asset
     *   Liability  payable, loan, debt, liability
     *   Equity     capital, equity, retained earnings, owner
     *   Revenue    revenue, income, sales, interest income, fee
     *   Expense    expense, wages, rent, supplies, maintenance, courier, cost
     *
     * Names matching nothing are treated as assets.
     */
    AccountType infer_account_type(const std::string& name);

    class AccountResolver {
    public:
        explicit AccountResolver(Ledger& ledger) : ledger_(ledger) {}

        /**
         * @brief Exact-name lookup, creating the account with an inferred type
         * when the chart does not have it yet.
         */
        Account& get_or_create(const std::string& name);

    private:
        Ledger& ledger_;
    };

} // namespace codec
} // namespace ducat

#endif // DUCAT_ACCOUNT_RESOLVER_HPP
