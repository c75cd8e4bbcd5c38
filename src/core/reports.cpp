/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: reports.cpp
 * ============================================================================
 */

#include "reports.hpp"

#include <iomanip>
#include <ostream>
#include <string>

namespace ducat {

namespace {

void rule(std::ostream& out, int width) {
    out << std::string(width, '-') << "\n";
}

// Account column left-aligned, amount right-aligned.
void amount_row(std::ostream& out, const std::string& label, const Money& amount) {
    out << std::left << std::setw(30) << label << " "
        << std::right << std::setw(10) << amount.to_string() << "\n";
}

void section(std::ostream& out, const std::string& title,
             const std::vector<StatementLine>& lines,
             const std::string& total_label, const Money& total) {
    out << title << "\n";
    rule(out, 40);
    for (const auto& line : lines) {
        amount_row(out, line.account, line.balance);
    }
    rule(out, 40);
    amount_row(out, total_label, total);
    out << "\n";
}

} // namespace

// ----------------------------------------------------------------------------
// print_trial_balance
// One row per non-zero account, debit and credit columns, then the totals.
// ----------------------------------------------------------------------------
void print_trial_balance(const TrialBalance& report, std::ostream& out) {
    out << std::left << std::setw(30) << "Account" << " "
        << std::setw(15) << "Debit" << " "
        << std::setw(15) << "Credit" << "\n";
    rule(out, 60);

    for (const auto& line : report.lines) {
        std::string debit = line.debit.is_zero() ? "" : line.debit.to_string();
        std::string credit = line.credit.is_zero() ? "" : line.credit.to_string();
        out << std::left << std::setw(30) << line.account << " "
            << std::setw(15) << debit << " "
            << std::setw(15) << credit << "\n";
    }

    rule(out, 60);
    out << std::left << std::setw(30) << "TOTAL" << " "
        << std::setw(15) << report.total_debits.to_string() << " "
        << std::setw(15) << report.total_credits.to_string() << "\n";

    if (report.is_balanced()) {
        out << "\nThe books are balanced.\n";
    } else {
        out << "\nWARNING: The books are NOT balanced.\n";
    }
}

void print_balance_sheet(const BalanceSheet& report, std::ostream& out) {
    section(out, "ASSETS", report.assets, "TOTAL ASSETS", report.total_assets);
    section(out, "LIABILITIES", report.liabilities, "TOTAL LIABILITIES", report.total_liabilities);
    section(out, "EQUITY", report.equity, "TOTAL EQUITY", report.total_equity);

    out << "ACCOUNTING EQUATION\n";
    rule(out, 40);
    amount_row(out, "Total Assets", report.total_assets);
    amount_row(out, "Total Liabilities + Equity", report.total_liabilities + report.total_equity);

    if (report.is_balanced()) {
        out << "\nThe accounting equation is balanced.\n";
    } else {
        out << "\nWARNING: The accounting equation is NOT balanced.\n";
    }
}

void print_income_statement(const IncomeStatement& report, std::ostream& out) {
    section(out, "REVENUE", report.revenue, "TOTAL REVENUE", report.total_revenue);
    section(out, "EXPENSES", report.expenses, "TOTAL EXPENSES", report.total_expenses);

    out << "SUMMARY\n";
    rule(out, 40);
    amount_row(out, "Total Revenue", report.total_revenue);
    amount_row(out, "Total Expenses", report.total_expenses);
    rule(out, 40);
    amount_row(out, "NET INCOME", report.net_income());
}

} // namespace ducat
