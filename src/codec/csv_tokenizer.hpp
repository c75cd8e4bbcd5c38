/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: csv_tokenizer.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Splits CSV text into records of fields, as written by spreadsheet and
 * Python csv writers. Fields may be wrapped in double quotes, which lets
 * them hold separators and line breaks; inside quotes "" is one literal
 * quote. Backslashes are ordinary characters.
 *
 * A record that cannot be tokenized is returned with its error set instead
 * of aborting the whole text, so callers can skip it and carry on.
 * ============================================================================
 */

#ifndef DUCAT_CSV_TOKENIZER_HPP
#define DUCAT_CSV_TOKENIZER_HPP

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace ducat {
namespace codec {

    using str_vec = std::vector<std::string>;

    struct CsvRecord {
        std::size_t line = 0;   // 1-based line the record starts on
        str_vec fields;
        std::string error;      // non-empty when the record failed to tokenize

        bool ok() const { return error.empty(); }
    };

    class CsvTokenizer {
    public:
        void set_separators(const std::string& separators);

        // Blank lines are skipped; trailing carriage returns are dropped.
        std::vector<CsvRecord> tokenize(std::istream& in) const;
        std::vector<CsvRecord> tokenize(const std::string& contents) const;

        // Quotes the field when it holds a separator, quote or line break, doubling inner quotes.
        std::string escape(const std::string& field) const;
        std::string join(const str_vec& fields) const;

    private:
        std::string sep_str = ",";
    };

} // namespace codec
} // namespace ducat

#endif // DUCAT_CSV_TOKENIZER_HPP
