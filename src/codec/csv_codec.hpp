/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: csv_codec.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Flat CSV transaction records, one row per transaction, header required:
 *
 *   id,date,description,debit_account,debit_amount,
 *   credit_account,credit_amount,credit_account_2,credit_amount_2
 *
 * Columns are found by header name and unknown columns are ignored, so
 * files from the historical generator (branch, type, counterparty, ...)
 * import as-is.
 *
 * The format is lossy and the loss is kept on purpose:
 *  - debit_account lists every debited account, comma-joined, and
 *    debit_amount is their total. Import splits that total equally, so
 *    uneven debit legs come back as equal halves (thirds, ...). A total that
 *    does not split into whole cents leaves the row unbalanced.
 *  - Only two credit legs fit. Export drops any further credit legs.
 * Use the JSON codec when every leg has to survive a round trip.
 * ============================================================================
 */

#ifndef DUCAT_CSV_CODEC_HPP
#define DUCAT_CSV_CODEC_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include "../core/ledger.hpp"

namespace ducat {
namespace codec {

    // @return Number of transactions written.
    std::size_t write_transactions_csv(const Ledger& ledger, std::ostream& out);

    /**
     * @throws ExportError if the file cannot be opened for writing.
     */
    std::size_t export_transactions_to_csv(const Ledger& ledger, const std::string& path);

    /**
     * @brief Posts every good row and skips the rest.
     * Per-row failures (MalformedRecordError, UnbalancedTransactionError) never
     * escape; they are logged, at WARN when verbose.
     * @throws ImportError if the header lacks a required column.
     * @return Number of rows posted.
     */
    std::size_t read_transactions_csv(Ledger& ledger, std::istream& in, bool verbose = false);

    /**
     * @throws ImportError if the file cannot be opened, or as read_transactions_csv.
     */
    std::size_t import_transactions_from_csv(Ledger& ledger, const std::string& path, bool verbose = false);

} // namespace codec
} // namespace ducat

#endif // DUCAT_CSV_CODEC_HPP
