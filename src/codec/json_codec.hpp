/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: json_codec.hpp
 * ============================================================================
 * * DESCRIPTION:
 * JSON transaction records. The document is a list of
 *
 *   {
 *     "id": 1,
 *     "date": "1397-01-01",
 *     "description": "Initial investment",
 *     "debits":  [ {"account": "Cash", "account_type": "ASSET", "amount": "10000.00"} ],
 *     "credits": [ {"account": "Owner's Capital", "account_type": "EQUITY", "amount": "10000.00"} ]
 *   }
 *
 * Every leg keeps its own account, type and exact amount, so this is the
 * format to use for a lossless round trip. Amounts are written as decimal
 * strings; on import a JSON number is accepted as well.
 * ============================================================================
 */

#ifndef DUCAT_JSON_CODEC_HPP
#define DUCAT_JSON_CODEC_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <nlohmann/json.hpp>
#include "../core/ledger.hpp"
#include "import_record.hpp"

using json = nlohmann::json;

namespace ducat {
namespace codec {

    json transaction_to_json(const Transaction& transaction, std::size_t id);

    /**
     * @brief Parses one element of the list.
     * @throws MalformedRecordError, UnknownAccountTypeError
     */
    ImportRecord record_from_json(const json& item);

    std::size_t write_transactions_json(const Ledger& ledger, std::ostream& out);

    // @throws ExportError if the file cannot be opened for writing.
    std::size_t export_transactions_to_json(const Ledger& ledger, const std::string& path);

    /**
     * @brief Posts every good record and skips the rest, logging each skip
     * (WARN when verbose).
     * @throws ImportError if the text is not JSON or its top level is not a list.
     * @return Number of records posted.
     */
    std::size_t read_transactions_json(Ledger& ledger, std::istream& in, bool verbose = false);

    // @throws ImportError if the file cannot be opened, or as read_transactions_json.
    std::size_t import_transactions_from_json(Ledger& ledger, const std::string& path, bool verbose = false);

} // namespace codec
} // namespace ducat

#endif // DUCAT_JSON_CODEC_HPP
