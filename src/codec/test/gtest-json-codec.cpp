/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: gtest-json-codec.cpp
 * ============================================================================
 */

#include "../json_codec.hpp"
#include "../../core/errors.hpp"
#include "../../core/log.hpp"

#include <sstream>
#include <string>
#include <gtest/gtest.h>

using namespace ducat;
using namespace ducat::codec;

class JsonCodecTest : public testing::Test
{
protected:
    void SetUp() override
    {
        set_log_echo(false);
        set_log_level("INFO");
        clear_logs();
    }

    void TearDown() override
    {
        set_log_echo(true);
        clear_logs();
    }

    std::size_t import_text(const std::string& text, bool verbose = false)
    {
        std::istringstream in(text);
        return read_transactions_json(t_ledger, in, verbose);
    }

    Ledger t_ledger {"JSON"};
};

TEST_F(JsonCodecTest, ImportsTypedLegs)
{
    std::size_t posted = import_text(R"([
        {
            "id": 1,
            "date": "1397-01-01",
            "description": "Initial investment",
            "debits":  [{"account": "Cash", "account_type": "ASSET", "amount": "10000.00"}],
            "credits": [{"account": "Owner's Capital", "account_type": "EQUITY", "amount": "10000.00"}]
        },
        {
            "date": "1397-03-01",
            "description": "",
            "debits":  [{"account": "Cash", "account_type": "asset", "amount": "250.00"}],
            "credits": [{"account": "Miscellaneous", "account_type": "Liability", "amount": "250.00"}]
        }
    ])");

    EXPECT_EQ(2u, posted);
    EXPECT_EQ(Money::parse("10250.00"), t_ledger.find_account("Cash")->balance());

    // The stated type wins over anything the name suggests.
    const Account* misc = t_ledger.find_account("Miscellaneous");
    ASSERT_NE(nullptr, misc);
    EXPECT_EQ(AccountType::Liability, misc->type());
    EXPECT_EQ(Money::parse("250.00"), misc->balance());

    EXPECT_EQ("", t_ledger.transactions()[1].description());
}

TEST_F(JsonCodecTest, NumericAmounts)
{
    std::size_t posted = import_text(R"([
        {"date": "1397-01-01", "description": "numbers",
         "debits":  [{"account": "Cash", "account_type": "ASSET", "amount": 100},
                     {"account": "Land", "account_type": "ASSET", "amount": 0.1}],
         "credits": [{"account": "Owner's Capital", "account_type": "EQUITY", "amount": 100.10}]}
    ])");

    EXPECT_EQ(1u, posted);
    EXPECT_EQ(Money::parse("100.00"), t_ledger.find_account("Cash")->balance());
    EXPECT_EQ(Money::parse("0.10"), t_ledger.find_account("Land")->balance());
    EXPECT_EQ(Money::parse("100.10"), t_ledger.find_account("Owner's Capital")->balance());
}

TEST_F(JsonCodecTest, BadRecordsAreSkipped)
{
    std::size_t posted = import_text(R"([
        {"date": "1397-01-01", "description": "seed",
         "debits":  [{"account": "Cash", "account_type": "ASSET", "amount": "100.00"}],
         "credits": [{"account": "Owner's Capital", "account_type": "EQUITY", "amount": "100.00"}]},
        {"date": "1397-01-02", "description": "unknown type",
         "debits":  [{"account": "Ghost", "account_type": "INCOME", "amount": "5.00"}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": "5.00"}]},
        {"date": "1397-01-03", "description": "unbalanced",
         "debits":  [{"account": "Ghost", "account_type": "EXPENSE", "amount": "5.00"}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": "4.00"}]},
        {"date": "1397-01-04", "description": "no credits",
         "debits":  [{"account": "Ghost", "account_type": "EXPENSE", "amount": "5.00"}]},
        {"date": "1397-01-05", "description": "missing type",
         "debits":  [{"account": "Ghost", "amount": "5.00"}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": "5.00"}]},
        {"date": "01/06/1397", "description": "bad date",
         "debits":  [{"account": "Ghost", "account_type": "EXPENSE", "amount": "5.00"}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": "5.00"}]},
        {"date": "1397-01-07", "description": "negative",
         "debits":  [{"account": "Ghost", "account_type": "EXPENSE", "amount": -5}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": -5}]},
        {"date": "1397-01-08", "description": "amount is a list",
         "debits":  [{"account": "Ghost", "account_type": "EXPENSE", "amount": [5]}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": "5.00"}]},
        {"date": "1397-01-08", "debits":  [{"account": "Ghost", "account_type": "EXPENSE", "amount": "5.00"}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": "5.00"}]},
        "not a record",
        {"date": "1397-01-09", "description": "wages",
         "debits":  [{"account": "Wages", "account_type": "EXPENSE", "amount": "30.00"}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": "30.00"}]}
    ])", true);

    EXPECT_EQ(2u, posted);
    EXPECT_EQ(Money::parse("70.00"), t_ledger.find_account("Cash")->balance());
    EXPECT_EQ(nullptr, t_ledger.find_account("Ghost"));

    std::size_t warnings = 0;
    for (const auto& line : recent_logs()) {
        if (line.find("[WARN] Skipping JSON record") != std::string::npos) {
            ++warnings;
        }
    }
    EXPECT_EQ(9u, warnings);
}

TEST_F(JsonCodecTest, FatalDocuments)
{
    EXPECT_THROW(import_text("[{\"date\": "), ImportError);
    EXPECT_THROW(import_text("{\"date\": \"1397-01-01\"}"), ImportError);
    EXPECT_THROW(import_transactions_from_json(t_ledger, testing::TempDir() + "no-such-ledger.json"), ImportError);
    EXPECT_EQ(0u, import_text("[]"));
}

TEST_F(JsonCodecTest, TransactionToJson)
{
    Account& cash = t_ledger.create_account("Cash", AccountType::Asset);
    Account& receivable = t_ledger.create_account("Accounts Receivable", AccountType::Asset);
    Account& interest = t_ledger.create_account("Interest Income", AccountType::Revenue);
    const Transaction& tx = t_ledger.record_transaction(Date(1397, 8, 10), "Repayment",
                                                        {{cash, "1200"}, {receivable, "-1000"}, {interest, "200"}});

    json j = transaction_to_json(tx, 3);
    EXPECT_EQ(3, j["id"].get<int>());
    EXPECT_EQ("1397-08-10", j["date"].get<std::string>());
    EXPECT_EQ("Repayment", j["description"].get<std::string>());
    ASSERT_EQ(1u, j["debits"].size());
    ASSERT_EQ(2u, j["credits"].size());
    EXPECT_EQ("Cash", j["debits"][0]["account"].get<std::string>());
    EXPECT_EQ("ASSET", j["debits"][0]["account_type"].get<std::string>());
    EXPECT_EQ("1200.00", j["debits"][0]["amount"].get<std::string>());
    EXPECT_EQ("Interest Income", j["credits"][1]["account"].get<std::string>());
    EXPECT_EQ("REVENUE", j["credits"][1]["account_type"].get<std::string>());
    EXPECT_EQ("200.00", j["credits"][1]["amount"].get<std::string>());
}

TEST_F(JsonCodecTest, RecordFromJson)
{
    ImportRecord record = record_from_json(json::parse(R"(
        {"date": "1397-02-15", "description": "Loan",
         "debits":  [{"account": "Accounts Receivable", "account_type": "ASSET", "amount": "2000.00"}],
         "credits": [{"account": "Cash", "account_type": "ASSET", "amount": "2000.00"}]}
    )"));

    EXPECT_EQ(Date(1397, 2, 15), record.date);
    ASSERT_EQ(1u, record.debits.size());
    EXPECT_TRUE(record.debits[0].has_type);
    EXPECT_EQ(AccountType::Asset, record.debits[0].type);
    EXPECT_EQ(Money::parse("2000.00"), record.credits[0].amount);

    EXPECT_THROW(record_from_json(json::parse(R"({"date": "1397-02-15", "debits": [], "credits": {}})")),
                 MalformedRecordError);
    EXPECT_THROW(record_from_json(json::parse(R"({"debits": [], "credits": []})")), MalformedRecordError);
}
