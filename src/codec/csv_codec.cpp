/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: csv_codec.cpp
 * ============================================================================
 */

#include "csv_codec.hpp"
#include "account_resolver.hpp"
#include "csv_tokenizer.hpp"
#include "import_record.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <fstream>
#include <map>
#include <ostream>
#include <stdexcept>

namespace ducat {
namespace codec {

namespace {

const str_vec kColumns = {
    "id", "date", "description",
    "debit_account", "debit_amount",
    "credit_account", "credit_amount",
    "credit_account_2", "credit_amount_2"
};

const str_vec kRequiredColumns = {
    "date", "description", "debit_account", "debit_amount", "credit_account", "credit_amount"
};

std::string trim(const std::string& s) {
    const char* ws = " \t";
    std::string::size_type first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    std::string::size_type last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

str_vec split_names(const std::string& joined) {
    str_vec names;
    std::string::size_type start = 0;
    while (true) {
        std::string::size_type comma = joined.find(',', start);
        names.push_back(trim(joined.substr(start, comma == std::string::npos ? std::string::npos : comma - start)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return names;
}

class CsvRow {
public:
    CsvRow(const std::map<std::string, std::size_t>& columns, const str_vec& fields)
        : columns_(columns), fields_(fields) {}

    bool has(const std::string& column) const {
        auto it = columns_.find(column);
        return it != columns_.end() && it->second < fields_.size();
    }

    // Missing columns and short rows read as empty for optional fields.
    std::string optional(const std::string& column) const {
        return has(column) ? fields_[columns_.at(column)] : "";
    }

    std::string required(const std::string& column) const {
        if (!has(column)) {
            throw MalformedRecordError("missing field '" + column + "'");
        }
        return fields_[columns_.at(column)];
    }

private:
    const std::map<std::string, std::size_t>& columns_;
    const str_vec& fields_;
};

ImportRecord parse_row(const CsvRow& row) {
    ImportRecord record;
    record.date = parse_record_date("date", trim(row.required("date")));
    record.description = row.required("description");

    // One debit_amount shared equally by every listed debit account.
    str_vec debit_names = split_names(row.required("debit_account"));
    Money debit_total = parse_record_amount("debit_amount", row.required("debit_amount"));
    for (const auto& name : debit_names) {
        if (name.empty()) {
            throw MalformedRecordError("debit_account: empty account name in '" + row.required("debit_account") + "'");
        }
    }
    money_cents parts = static_cast<money_cents>(debit_names.size());
    if (debit_total.cents() % parts != 0) {
        throw UnbalancedTransactionError("debit_amount " + debit_total.to_string() + " cannot be split equally across "
                                         + std::to_string(parts) + " debit accounts.");
    }
    Money share = Money::from_cents(debit_total.cents() / parts);
    for (const auto& name : debit_names) {
        RecordLeg leg;
        leg.account = name;
        leg.amount = share;
        record.debits.push_back(leg);
    }

    RecordLeg credit;
    credit.account = trim(row.required("credit_account"));
    if (credit.account.empty()) {
        throw MalformedRecordError("credit_account: empty account name");
    }
    credit.amount = parse_record_amount("credit_amount", row.required("credit_amount"));
    record.credits.push_back(credit);

    // The second credit leg only counts when it carries a positive amount;
    // zero and negative amounts leave it out.
    std::string amount_2 = trim(row.optional("credit_amount_2"));
    if (!amount_2.empty()) {
        RecordLeg credit_2;
        try {
            credit_2.amount = Money::parse(amount_2);
        } catch (const std::invalid_argument& e) {
            throw MalformedRecordError("credit_amount_2: " + std::string(e.what()));
        }
        if (credit_2.amount > Money()) {
            credit_2.account = trim(row.optional("credit_account_2"));
            if (credit_2.account.empty()) {
                throw MalformedRecordError("credit_account_2: missing for credit_amount_2 " + credit_2.amount.to_string());
            }
            record.credits.push_back(credit_2);
        }
    }

    return record;
}

} // namespace

std::size_t write_transactions_csv(const Ledger& ledger, std::ostream& out) {
    CsvTokenizer tokenizer;
    out << tokenizer.join(kColumns) << "\n";

    std::size_t id = 0;
    for (const auto& transaction : ledger.transactions()) {
        ++id;

        std::string debit_names;
        for (const auto& entry : transaction.debits()) {
            if (!debit_names.empty()) debit_names += ",";
            debit_names += entry.account->name();
        }

        const auto& credits = transaction.credits();
        if (credits.size() > 2) {
            ducat_log("DEBUG", "CSV export of transaction " + std::to_string(id) + " keeps 2 of "
                      + std::to_string(credits.size()) + " credit legs.");
        }

        str_vec row = {
            std::to_string(id),
            transaction.date().to_string(),
            transaction.description(),
            debit_names,
            transaction.total_debits().to_string(),
            credits.size() > 0 ? credits[0].account->name() : "",
            credits.size() > 0 ? credits[0].amount.to_string() : "",
            credits.size() > 1 ? credits[1].account->name() : "",
            credits.size() > 1 ? credits[1].amount.to_string() : ""
        };
        out << tokenizer.join(row) << "\n";
    }

    return id;
}

std::size_t export_transactions_to_csv(const Ledger& ledger, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ExportError("Cannot open '" + path + "' for writing.");
    }

    std::size_t count = write_transactions_csv(ledger, file);
    file.flush();
    if (!file) {
        throw ExportError("Failed while writing '" + path + "'.");
    }

    ducat_log("INFO", "Exported " + std::to_string(count) + " transactions to CSV file " + path);
    return count;
}

std::size_t read_transactions_csv(Ledger& ledger, std::istream& in, bool verbose) {
    CsvTokenizer tokenizer;
    std::vector<CsvRecord> records = tokenizer.tokenize(in);
    if (records.empty()) {
        return 0;
    }

    const CsvRecord& header = records.front();
    if (!header.ok()) {
        throw ImportError("CSV header could not be read: " + header.error);
    }

    std::map<std::string, std::size_t> columns;
    for (std::size_t i = 0; i < header.fields.size(); ++i) {
        std::string name = trim(header.fields[i]);
        if (i == 0 && name.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            name = name.substr(3); // UTF-8 byte order mark
        }
        columns.emplace(name, i);
    }
    for (const auto& column : kRequiredColumns) {
        if (columns.find(column) == columns.end()) {
            throw ImportError("CSV header is missing required column '" + column + "'.");
        }
    }

    AccountResolver resolver(ledger);
    std::size_t posted = 0;

    for (std::size_t i = 1; i < records.size(); ++i) {
        const CsvRecord& record = records[i];
        std::string where = "CSV row at line " + std::to_string(record.line);

        if (!record.ok()) {
            report_skipped(where, record.error, verbose);
            continue;
        }

        try {
            post_record(ledger, resolver, parse_row(CsvRow(columns, record.fields)));
            ++posted;
        } catch (const Error& e) {
            report_skipped(where, e.what(), verbose);
        }
    }

    return posted;
}

std::size_t import_transactions_from_csv(Ledger& ledger, const std::string& path, bool verbose) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ImportError("Cannot open CSV file '" + path + "'.");
    }

    std::size_t posted = read_transactions_csv(ledger, file, verbose);
    ducat_log("INFO", "Imported " + std::to_string(posted) + " transactions from CSV file " + path);
    return posted;
}

} // namespace codec
} // namespace ducat
