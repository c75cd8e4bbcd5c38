/**
 * Ducat: Double-Entry Ledger Engine - Core Ledger Logic
 * Focus: Double-entry validation and the single posting gateway.
 */

#include "ledger.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <map>
#include <memory>
#include <stdexcept>
#include <utility>

namespace ducat {

Ledger::Ledger(std::string name) : name_(std::move(name)) {}

Account& Ledger::create_account(const std::string& name, AccountType type) {
    if (index_.find(name) != index_.end()) {
        throw DuplicateAccountError("Account '" + name + "' already exists in ledger '" + name_ + "'.");
    }

    accounts_.push_back(std::make_unique<Account>(name, type));
    Account& account = *accounts_.back();
    index_[name] = &account;
    return account;
}

Account& Ledger::get_or_create_account(const std::string& name, AccountType type) {
    Account* existing = find_account(name);
    if (existing == nullptr) {
        return create_account(name, type);
    }
    if (existing->type() != type) {
        ducat_log("WARN", "Account '" + name + "' is " + to_string(existing->type())
                  + ", ignoring requested type " + to_string(type) + ".");
    }
    return *existing;
}

Account* Ledger::find_account(const std::string& name) {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

const Account* Ledger::find_account(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : it->second;
}

bool Ledger::owns(const Account* account) const {
    if (account == nullptr) return false;
    auto it = index_.find(account->name());
    return it != index_.end() && it->second == account;
}

const Transaction& Ledger::record_transaction(const Date& date,
                                              const std::string& description,
                                              std::initializer_list<LedgerLine> lines) {
    return record_transaction(date, description, std::vector<LedgerLine>(lines));
}

const Transaction& Ledger::record_transaction(const Date& date,
                                              const std::string& description,
                                              const std::vector<LedgerLine>& lines) {
    Transaction transaction(date, description);

    // Positive lines increase the account: a debit for Asset/Expense, a credit
    // for Liability/Equity/Revenue. Negative lines go to the other side.
    for (const auto& line : lines) {
        if (line.account == nullptr) {
            throw UnknownAccountError("Transaction '" + description + "' has a line without an account.");
        }
        bool increase = !line.amount.is_negative();
        bool debit_normal = debit_sign(line.account->type()) > 0;
        TransactionEntry entry(*line.account, line.amount.abs());

        if (increase == debit_normal) {
            transaction.add_debit(entry);
        } else {
            transaction.add_credit(entry);
        }
    }

    return post(std::move(transaction));
}

/**
 * validate_transaction
 * Ensures that the sum of debits equals the sum of credits and that every
 * line belongs to this ledger. Nothing is mutated here.
 */
void Ledger::validate_transaction(const Transaction& transaction) const {
    // A one-sided entry is logically invalid, even when it sums to zero.
    if (!transaction.has_both_sides()) {
        throw UnbalancedTransactionError("Transaction '" + transaction.description()
                                         + "' must have at least one debit and one credit.");
    }

    for (const auto* side : {&transaction.debits(), &transaction.credits()}) {
        for (const auto& entry : *side) {
            if (!owns(entry.account)) {
                throw UnknownAccountError("Transaction '" + transaction.description()
                                          + "' references an account outside ledger '" + name_ + "'.");
            }
            if (entry.amount.is_negative()) {
                throw UnbalancedTransactionError("Transaction '" + transaction.description()
                                                 + "' carries a negative entry amount.");
            }
        }
    }

    // If the totals aren't exactly equal, the entry is rejected.
    if (!transaction.is_balanced()) {
        Money deviation = transaction.total_debits() - transaction.total_credits();
        throw UnbalancedTransactionError("Transaction '" + transaction.description()
                                         + "' is not balanced: debits " + transaction.total_debits().to_string()
                                         + ", credits " + transaction.total_credits().to_string()
                                         + " (deviation " + deviation.to_string() + ").");
    }

    // Replay the entries in posting order on copies of the balances, so an
    // amount that would overflow an account is refused before anything moves.
    std::map<const Account*, Money> projected;
    auto replay = [&](const TransactionEntry& entry, int side) {
        Money& balance = projected.emplace(entry.account, entry.account->balance()).first->second;
        try {
            if (side * debit_sign(entry.account->type()) > 0) {
                balance += entry.amount;
            } else {
                balance -= entry.amount;
            }
        } catch (const AmountOverflowError&) {
            throw AmountOverflowError("Transaction '" + transaction.description() + "' would take account '"
                                      + entry.account->name() + "' out of the representable range.");
        }
    };
    for (const auto& entry : transaction.debits()) replay(entry, 1);
    for (const auto& entry : transaction.credits()) replay(entry, -1);
}

const Transaction& Ledger::post(Transaction transaction) {
    if (transaction.is_posted()) {
        throw std::logic_error("Transaction '" + transaction.description() + "' has already been posted.");
    }
    validate_transaction(transaction);

    // Append first so a failed allocation leaves every balance untouched.
    transactions_.push_back(std::move(transaction));
    Transaction& stored = transactions_.back();
    stored.post();

    ducat_log("DEBUG", stored.to_string());
    return stored;
}

Money Ledger::debit_normalized_total() const {
    Money total;
    for (const auto& account : accounts_) {
        total += account->debit_normalized_balance();
    }
    return total;
}

TrialBalance Ledger::trial_balance() const {
    TrialBalance report;

    for (const auto& account : accounts_) {
        const Money& balance = account->balance();
        if (balance.is_zero()) continue;

        // Natural side for a positive balance; a negative one flips columns.
        bool debit_column = (debit_sign(account->type()) > 0) != balance.is_negative();

        TrialBalanceLine line;
        line.account = account->name();
        if (debit_column) {
            line.debit = balance.abs();
            report.total_debits += line.debit;
        } else {
            line.credit = balance.abs();
            report.total_credits += line.credit;
        }
        report.lines.push_back(line);
    }

    return report;
}

std::vector<StatementLine> Ledger::statement_lines(AccountType type, Money& total) const {
    std::vector<StatementLine> lines;
    for (const auto& account : accounts_) {
        if (account->type() != type || account->balance().is_zero()) continue;
        lines.push_back(StatementLine{account->name(), account->balance()});
        total += account->balance();
    }
    return lines;
}

BalanceSheet Ledger::balance_sheet() const {
    BalanceSheet report;
    report.assets = statement_lines(AccountType::Asset, report.total_assets);
    report.liabilities = statement_lines(AccountType::Liability, report.total_liabilities);
    report.equity = statement_lines(AccountType::Equity, report.total_equity);
    return report;
}

IncomeStatement Ledger::income_statement() const {
    IncomeStatement report;
    report.revenue = statement_lines(AccountType::Revenue, report.total_revenue);
    report.expenses = statement_lines(AccountType::Expense, report.total_expenses);
    return report;
}

void Ledger::print_trial_balance(std::ostream& out) const {
    ducat::print_trial_balance(trial_balance(), out);
}

void Ledger::print_balance_sheet(std::ostream& out) const {
    ducat::print_balance_sheet(balance_sheet(), out);
}

void Ledger::print_income_statement(std::ostream& out) const {
    ducat::print_income_statement(income_statement(), out);
}

} // namespace ducat
