/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: reports.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Read-side projections of a Ledger. Built by Ledger::trial_balance(),
 * Ledger::balance_sheet() and Ledger::income_statement(); the print_*
 * functions render them as fixed-width text.
 * ============================================================================
 */

#ifndef DUCAT_REPORTS_HPP
#define DUCAT_REPORTS_HPP

#include <iosfwd>
#include <string>
#include <vector>
#include "money.hpp"

namespace ducat {

    struct TrialBalanceLine {
        std::string account;
        Money debit;
        Money credit;
    };

    /**
     * @brief Every non-zero account balance on its natural side.
     * A balance of the unexpected sign (a contra account) is shown in the
     * opposite column as its absolute value.
     */
    struct TrialBalance {
        std::vector<TrialBalanceLine> lines;
        Money total_debits;
        Money total_credits;

        bool is_balanced() const { return total_debits == total_credits; }
    };

    struct StatementLine {
        std::string account;
        Money balance;
    };

    struct BalanceSheet {
        std::vector<StatementLine> assets;
        std::vector<StatementLine> liabilities;
        std::vector<StatementLine> equity;
        Money total_assets;
        Money total_liabilities;
        Money total_equity;

        // Assets = Liabilities + Equity
        bool is_balanced() const { return total_assets == total_liabilities + total_equity; }
    };

    struct IncomeStatement {
        std::vector<StatementLine> revenue;
        std::vector<StatementLine> expenses;
        Money total_revenue;
        Money total_expenses;

        Money net_income() const { return total_revenue - total_expenses; }
    };

    void print_trial_balance(const TrialBalance& report, std::ostream& out);
    void print_balance_sheet(const BalanceSheet& report, std::ostream& out);
    void print_income_statement(const IncomeStatement& report, std::ostream& out);

} // namespace ducat

#endif // DUCAT_REPORTS_HPP
