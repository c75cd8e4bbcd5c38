/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: account_resolver.cpp
 * ============================================================================
 */

#include "account_resolver.hpp"
#include "../core/log.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace ducat {
namespace codec {

namespace {

typedef std::pair<AccountType, std::vector<std::string>> KeywordRule;

// Order matters: "Interest Income Payable" is a liability.
const std::vector<KeywordRule>& keyword_rules() {
    static const std::vector<KeywordRule> rules = {
        {AccountType::Asset,     {"cash", "receivable", "inventory", "land", "building", "equipment", "asset"}},
        {AccountType::Liability, {"payable", "loan", "debt", "liability"}},
        {AccountType::Equity,    {"capital", "equity", "retained earnings", "owner"}},
        {AccountType::Revenue,   {"revenue", "income", "sales", "interest income", "fee"}},
        {AccountType::Expense,   {"expense", "wages", "rent", "supplies", "maintenance", "courier", "cost"}},
    };
    return rules;
}

} // namespace

AccountType infer_account_type(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& rule : keyword_rules()) {
        for (const auto& keyword : rule.second) {
            if (lower.find(keyword) != std::string::npos) {
                return rule.first;
            }
        }
    }
    return AccountType::Asset;
}

Account& AccountResolver::get_or_create(const std::string& name) {
    Account* existing = ledger_.find_account(name);
    if (existing != nullptr) {
        return *existing;
    }

    AccountType type = infer_account_type(name);
    ducat_log("DEBUG", "Creating account '" + name + "' as " + to_string(type) + " from its name.");
    return ledger_.create_account(name, type);
}

} // namespace codec
} // namespace ducat
