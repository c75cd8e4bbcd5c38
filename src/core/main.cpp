/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine - Command Line
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 */

#include <cctype>
#include <iostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include "config.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "../codec/csv_codec.hpp"
#include "../codec/json_codec.hpp"

namespace bpo = boost::program_options;

namespace {

enum class FileFormat { Csv, Json, Unknown };

FileFormat format_of(const std::string& path) {
    auto dot = path.rfind('.');
    std::string ext = dot == std::string::npos ? "" : path.substr(dot + 1);
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == "csv") return FileFormat::Csv;
    if (ext == "json") return FileFormat::Json;
    return FileFormat::Unknown;
}

std::size_t import_file(ducat::Ledger& ledger, const std::string& path, bool verbose) {
    switch (format_of(path)) {
        case FileFormat::Csv:
            return ducat::codec::import_transactions_from_csv(ledger, path, verbose);
        case FileFormat::Json:
            return ducat::codec::import_transactions_from_json(ledger, path, verbose);
        case FileFormat::Unknown:
            break;
    }
    throw ducat::ImportError("Cannot tell the format of '" + path + "'; expected a .csv or .json file.");
}

std::size_t export_file(const ducat::Ledger& ledger, const std::string& path) {
    switch (format_of(path)) {
        case FileFormat::Csv:
            return ducat::codec::export_transactions_to_csv(ledger, path);
        case FileFormat::Json:
            return ducat::codec::export_transactions_to_json(ledger, path);
        case FileFormat::Unknown:
            break;
    }
    throw ducat::ExportError("Cannot tell the format of '" + path + "'; expected a .csv or .json file.");
}

void print_reports(const ducat::Ledger& ledger) {
    std::cout << "\n=== " << ledger.name() << " TRIAL BALANCE ===\n";
    ledger.print_trial_balance(std::cout);
    std::cout << "\n=== " << ledger.name() << " BALANCE SHEET ===\n";
    ledger.print_balance_sheet(std::cout);
    std::cout << "\n=== " << ledger.name() << " INCOME STATEMENT ===\n";
    ledger.print_income_statement(std::cout);
}

// The Medici Bank's first year of business, 1397.
void build_demo_ledger(ducat::Ledger& ledger) {
    using ducat::AccountType;
    using ducat::Date;

    auto& cash = ledger.create_account("Cash", AccountType::Asset);
    auto& receivable = ledger.create_account("Accounts Receivable", AccountType::Asset);
    ledger.create_account("Inventory", AccountType::Asset);
    auto& land = ledger.create_account("Land", AccountType::Asset);

    ledger.create_account("Accounts Payable", AccountType::Liability);
    ledger.create_account("Loans", AccountType::Liability);

    auto& capital = ledger.create_account("Owner's Capital", AccountType::Equity);
    ledger.create_account("Retained Earnings", AccountType::Equity);

    ledger.create_account("Revenue", AccountType::Revenue);
    auto& interest = ledger.create_account("Interest Income", AccountType::Revenue);

    ledger.create_account("Expenses", AccountType::Expense);
    auto& wages = ledger.create_account("Wages", AccountType::Expense);

    ledger.record_transaction(Date(1397, 1, 1), "Initial investment from Giovanni de' Medici",
                              {{cash, "10000.00"}, {capital, "10000.00"}});
    ledger.record_transaction(Date(1397, 2, 15), "Loan to Wool Merchant",
                              {{receivable, "2000.00"}, {cash, "-2000.00"}});
    ledger.record_transaction(Date(1397, 8, 10), "Partial loan repayment from Wool Merchant with interest",
                              {{cash, "1200.00"}, {receivable, "-1000.00"}, {interest, "200.00"}});
    ledger.record_transaction(Date(1397, 9, 5), "Purchase of land for new Medici banking house",
                              {{land, "3000.00"}, {cash, "-3000.00"}});
    ledger.record_transaction(Date(1397, 12, 1), "Quarterly wages for bank employees",
                              {{wages, "800.00"}, {cash, "-800.00"}});
}

const char* kUsage =
    "Usage: ducat [options] <command> [files...]\n\n"
    "Commands:\n"
    "  demo                  Build the Medici Bank ledger for 1397 and print its reports\n"
    "  report <file>         Import a .csv or .json file and print its reports\n"
    "  convert <in> <out>    Import one file and export it in the format of the other\n"
    "  fingerprint <file>    Import a file and print the SHA-256 fingerprint of its postings\n";

} // namespace

int main(int argc, char** argv) {
    boost::optional<std::string> config_path;
    boost::optional<std::string> ledger_name;
    std::string command;
    std::vector<std::string> files;

    bpo::options_description options("Options");
    options.add_options()
        ("help,h", "Show this help")
        ("verbose,v", "Report every skipped import record")
        ("config,c", bpo::value(&config_path), "JSON settings file (default: $DUCAT_CONFIG)")
        ("name,n", bpo::value(&ledger_name), "Ledger name used in reports");

    bpo::options_description hidden;
    hidden.add_options()
        ("command", bpo::value(&command))
        ("files", bpo::value(&files));

    bpo::options_description all;
    all.add(options).add(hidden);

    bpo::positional_options_description positional;
    positional.add("command", 1).add("files", -1);

    bpo::variables_map vm;
    try {
        bpo::store(bpo::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        bpo::notify(vm);
    } catch (const bpo::error& e) {
        std::cerr << e.what() << "\n\n" << kUsage << "\n" << options;
        return 2;
    }

    if (vm.count("help") || command.empty()) {
        std::cout << kUsage << "\n" << options;
        return command.empty() && !vm.count("help") ? 2 : 0;
    }

    ducat::Config config = ducat::load_config(config_path ? *config_path : "");
    if (ledger_name) config.ledger_name = *ledger_name;
    if (vm.count("verbose")) config.verbose_import = true;
    ducat::apply_logging(config);

    try {
        ducat::Ledger ledger(config.ledger_name);

        if (command == "demo") {
            build_demo_ledger(ledger);
            print_reports(ledger);
            return 0;
        }

        if (command == "report" && files.size() == 1) {
            std::size_t count = import_file(ledger, files[0], config.verbose_import);
            ducat::ducat_log("INFO", "Loaded " + std::to_string(count) + " transactions into " + ledger.name());
            print_reports(ledger);
            return 0;
        }

        if (command == "convert" && files.size() == 2) {
            std::size_t imported = import_file(ledger, files[0], config.verbose_import);
            std::size_t exported = export_file(ledger, files[1]);
            std::cout << "Imported " << imported << ", exported " << exported << " transactions.\n";
            return 0;
        }

        if (command == "fingerprint" && files.size() == 1) {
            import_file(ledger, files[0], config.verbose_import);
            std::cout << ducat::DucatCrypto::fingerprint(ledger) << "  " << files[0] << "\n";
            return 0;
        }

        std::cerr << "Unknown command or wrong number of files: " << command << "\n\n" << kUsage;
        return 2;
    } catch (const std::exception& e) {
        ducat::ducat_log("FATAL", e.what());
        return 1;
    }
}
