/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: json_codec.cpp
 * ============================================================================
 */

#include "json_codec.hpp"
#include "account_resolver.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <cstdio>
#include <fstream>
#include <ostream>

namespace ducat {
namespace codec {

namespace {

json entry_to_json(const TransactionEntry& entry) {
    return {
        {"account", entry.account->name()},
        {"account_type", to_string(entry.account->type())},
        {"amount", entry.amount.to_string()}
    };
}

std::string required_string(const json& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        throw MalformedRecordError("missing field '" + key + "'");
    }
    if (!it->is_string()) {
        throw MalformedRecordError("field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

// Numbers go through their shortest decimal text so 0.285 stays 0.285
// and is then rounded like any other amount string.
Money amount_from_json(const json& value, const std::string& field) {
    if (value.is_string()) {
        return parse_record_amount(field, value.get<std::string>());
    }
    if (value.is_number_integer()) {
        return parse_record_amount(field, value.dump());
    }
    if (value.is_number_float()) {
        char text[64];
        std::snprintf(text, sizeof(text), "%.15g", value.get<double>());
        return parse_record_amount(field, text);
    }
    throw MalformedRecordError(field + ": amount must be a string or a number");
}

std::vector<RecordLeg> legs_from_json(const json& item, const std::string& side) {
    auto it = item.find(side);
    if (it == item.end() || !it->is_array()) {
        throw MalformedRecordError("field '" + side + "' must be a list");
    }

    std::vector<RecordLeg> legs;
    for (std::size_t i = 0; i < it->size(); ++i) {
        const json& entry = (*it)[i];
        std::string where = side + "[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            throw MalformedRecordError(where + " must be an object");
        }

        RecordLeg leg;
        leg.account = required_string(entry, "account");
        if (leg.account.empty()) {
            throw MalformedRecordError(where + ".account is empty");
        }
        leg.type = account_type_from_string(required_string(entry, "account_type"));
        leg.has_type = true;

        auto amount = entry.find("amount");
        if (amount == entry.end()) {
            throw MalformedRecordError("missing field '" + where + ".amount'");
        }
        leg.amount = amount_from_json(*amount, where + ".amount");
        legs.push_back(leg);
    }
    return legs;
}

} // namespace

json transaction_to_json(const Transaction& transaction, std::size_t id) {
    json debits = json::array();
    for (const auto& entry : transaction.debits()) {
        debits.push_back(entry_to_json(entry));
    }

    json credits = json::array();
    for (const auto& entry : transaction.credits()) {
        credits.push_back(entry_to_json(entry));
    }

    return {
        {"id", id},
        {"date", transaction.date().to_string()},
        {"description", transaction.description()},
        {"debits", debits},
        {"credits", credits}
    };
}

ImportRecord record_from_json(const json& item) {
    if (!item.is_object()) {
        throw MalformedRecordError("record must be an object");
    }

    ImportRecord record;
    record.date = parse_record_date("date", required_string(item, "date"));

    record.description = required_string(item, "description");

    record.debits = legs_from_json(item, "debits");
    record.credits = legs_from_json(item, "credits");
    return record;
}

std::size_t write_transactions_json(const Ledger& ledger, std::ostream& out) {
    json ledger_json = json::array();

    std::size_t id = 0;
    for (const auto& transaction : ledger.transactions()) {
        ledger_json.push_back(transaction_to_json(transaction, ++id));
    }

    out << ledger_json.dump(2) << "\n";
    return id;
}

std::size_t export_transactions_to_json(const Ledger& ledger, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ExportError("Cannot open '" + path + "' for writing.");
    }

    std::size_t count = write_transactions_json(ledger, file);
    file.flush();
    if (!file) {
        throw ExportError("Failed while writing '" + path + "'.");
    }

    ducat_log("INFO", "Exported " + std::to_string(count) + " transactions to JSON file " + path);
    return count;
}

std::size_t read_transactions_json(Ledger& ledger, std::istream& in, bool verbose) {
    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ImportError("Invalid JSON: " + std::string(e.what()));
    }

    if (!doc.is_array()) {
        throw ImportError("JSON transactions must be a list of records.");
    }

    AccountResolver resolver(ledger);
    std::size_t posted = 0;

    for (std::size_t i = 0; i < doc.size(); ++i) {
        std::string where = "JSON record " + std::to_string(i + 1);
        try {
            post_record(ledger, resolver, record_from_json(doc[i]));
            ++posted;
        } catch (const Error& e) {
            report_skipped(where, e.what(), verbose);
        } catch (const json::exception& e) {
            report_skipped(where, e.what(), verbose);
        }
    }

    return posted;
}

std::size_t import_transactions_from_json(Ledger& ledger, const std::string& path, bool verbose) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ImportError("Cannot open JSON file '" + path + "'.");
    }

    std::size_t posted = read_transactions_json(ledger, file, verbose);
    ducat_log("INFO", "Imported " + std::to_string(posted) + " transactions from JSON file " + path);
    return posted;
}

} // namespace codec
} // namespace ducat
