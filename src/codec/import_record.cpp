/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: import_record.cpp
 * ============================================================================
 */

#include "import_record.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <stdexcept>
#include <utility>

namespace ducat {
namespace codec {

namespace {

Money leg_total(const std::vector<RecordLeg>& legs) {
    Money total;
    for (const auto& leg : legs) {
        total += leg.amount;
    }
    return total;
}

Account& resolve(Ledger& ledger, AccountResolver& resolver, const RecordLeg& leg) {
    if (leg.has_type) {
        return ledger.get_or_create_account(leg.account, leg.type);
    }
    return resolver.get_or_create(leg.account);
}

} // namespace

void ImportRecord::check_balanced() const {
    if (debits.empty() || credits.empty()) {
        throw UnbalancedTransactionError("Record '" + description + "' needs at least one debit and one credit.");
    }

    Money total_debits = leg_total(debits);
    Money total_credits = leg_total(credits);
    if (total_debits != total_credits) {
        throw UnbalancedTransactionError("Record '" + description + "' is not balanced: debits "
                                         + total_debits.to_string() + ", credits " + total_credits.to_string() + ".");
    }
}

Date parse_record_date(const std::string& field, const std::string& text) {
    try {
        return Date::parse(text);
    } catch (const std::invalid_argument& e) {
        throw MalformedRecordError(field + ": " + e.what());
    }
}

Money parse_record_amount(const std::string& field, const std::string& text) {
    Money amount;
    try {
        amount = Money::parse(text);
    } catch (const std::invalid_argument& e) {
        throw MalformedRecordError(field + ": " + e.what());
    }
    if (amount.is_negative()) {
        throw MalformedRecordError(field + ": amount '" + text + "' must not be negative.");
    }
    return amount;
}

const Transaction& post_record(Ledger& ledger, AccountResolver& resolver, const ImportRecord& record) {
    record.check_balanced();

    Transaction transaction(record.date, record.description);
    for (const auto& leg : record.debits) {
        transaction.add_debit(TransactionEntry(resolve(ledger, resolver, leg), leg.amount));
    }
    for (const auto& leg : record.credits) {
        transaction.add_credit(TransactionEntry(resolve(ledger, resolver, leg), leg.amount));
    }

    return ledger.post(std::move(transaction));
}

void report_skipped(const std::string& where, const std::string& reason, bool verbose) {
    ducat_log(verbose ? "WARN" : "DEBUG", "Skipping " + where + ": " + reason);
}

} // namespace codec
} // namespace ducat
