/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: import_record.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Format-neutral form of one imported transaction. The CSV and JSON readers
 * parse a row into an ImportRecord, which is checked for balance while it
 * still holds plain account names. Accounts are only created once a record
 * is known to be good, so a rejected row leaves the chart of accounts alone.
 * ============================================================================
 */

#ifndef DUCAT_IMPORT_RECORD_HPP
#define DUCAT_IMPORT_RECORD_HPP

#include <string>
#include <vector>
#include "../core/date.hpp"
#include "../core/ledger.hpp"
#include "../core/money.hpp"
#include "account_resolver.hpp"

namespace ducat {
namespace codec {

    struct RecordLeg {
        std::string account;
        Money amount;
        bool has_type = false;           // JSON legs carry their type, CSV legs do not
        AccountType type = AccountType::Asset;
    };

    struct ImportRecord {
        Date date;
        std::string description;
        std::vector<RecordLeg> debits;
        std::vector<RecordLeg> credits;

        /**
         * @throws UnbalancedTransactionError when a side is empty or the totals
         * differ.
         */
        void check_balanced() const;
    };

    // @throws MalformedRecordError naming the field when the text is not an ISO date.
    Date parse_record_date(const std::string& field, const std::string& text);

    // @throws MalformedRecordError when the text is not a non-negative amount.
    Money parse_record_amount(const std::string& field, const std::string& text);

    /**
     * @brief Checks the record, resolves its accounts and posts it through
     * Ledger::post. Typed legs use get_or_create_account; untyped legs go
     * through the resolver's name inference.
     */
    const Transaction& post_record(Ledger& ledger, AccountResolver& resolver, const ImportRecord& record);

    // Logs a skipped record: WARN when verbose, DEBUG otherwise.
    void report_skipped(const std::string& where, const std::string& reason, bool verbose);

} // namespace codec
} // namespace ducat

#endif // DUCAT_IMPORT_RECORD_HPP
