/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: gtest-csv-codec.cpp
 * ============================================================================
 */

#include "../csv_codec.hpp"
#include "../../core/errors.hpp"
#include "../../core/log.hpp"

#include <sstream>
#include <string>
#include <gtest/gtest.h>

using namespace ducat;
using namespace ducat::codec;

namespace {

const std::string kHeader =
    "id,date,description,debit_account,debit_amount,credit_account,credit_amount,credit_account_2,credit_amount_2\n";

} // namespace

class CsvCodecTest : public testing::Test
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
        return read_transactions_csv(t_ledger, in, verbose);
    }

    Money balance_of(const std::string& name) const
    {
        const Account* account = t_ledger.find_account(name);
        return account ? account->balance() : Money();
    }

    Ledger t_ledger {"CSV"};
};

TEST_F(CsvCodecTest, ImportsRows)
{
    std::size_t posted = import_text(kHeader +
        "1,1397-01-01,Initial investment,Cash,10000.00,Owner's Capital,10000.00,,\n"
        "2,1397-02-15,Loan to Wool Merchant,Accounts Receivable,2000.00,Cash,2000.00,,\n"
        "3,1397-08-10,Repayment,Cash,1200.00,Accounts Receivable,1000.00,Interest Income,200.00\n");

    EXPECT_EQ(3u, posted);
    EXPECT_EQ(3u, t_ledger.transactions().size());
    EXPECT_EQ(Money::parse("9200.00"), balance_of("Cash"));
    EXPECT_EQ(Money::parse("1000.00"), balance_of("Accounts Receivable"));
    EXPECT_EQ(Money::parse("200.00"), balance_of("Interest Income"));

    EXPECT_EQ(AccountType::Equity, t_ledger.find_account("Owner's Capital")->type());
    EXPECT_EQ(AccountType::Revenue, t_ledger.find_account("Interest Income")->type());
    EXPECT_TRUE(t_ledger.trial_balance().is_balanced());
}

TEST_F(CsvCodecTest, BadRowsAreSkipped)
{
    std::size_t posted = import_text(kHeader +
        "1,1397-01-01,seed,Cash,100.00,Owner's Capital,100.00,,\n"
        "2,1397-13-01,bad date,Ghost Asset,5.00,Cash,5.00,,\n"
        "3,1397-01-02,bad amount,Ghost Asset,five,Cash,five,,\n"
        "4,1397-01-03,unbalanced,Phantom Expense,10.00,Cash,9.00,,\n"
        "5,1397-01-04,negative,Ghost Asset,-5.00,Cash,-5.00,,\n"
        "6,1397-01-05,short row,Ghost Asset\n"
        "7,,no date,Ghost Asset,1.00,Cash,1.00,,\n"
        "8,1397-01-07,wages,Wages,40.00,Cash,40.00,,\n"
        "9,1397-01-08,more capital,Cash,60.00,Owner's Capital,60.00,,\n");

    EXPECT_EQ(3u, posted);
    EXPECT_EQ(3u, t_ledger.transactions().size());
    EXPECT_EQ(Money::parse("120.00"), balance_of("Cash"));

    // Accounts named only by rejected rows are never opened.
    EXPECT_EQ(nullptr, t_ledger.find_account("Ghost Asset"));
    EXPECT_EQ(nullptr, t_ledger.find_account("Phantom Expense"));
    EXPECT_EQ(3u, t_ledger.accounts().size());
}

TEST_F(CsvCodecTest, SkipsAreWarningsWhenVerbose)
{
    std::string text = kHeader +
        "1,1397-01-01,seed,Cash,100.00,Owner's Capital,100.00,,\n"
        "2,1397-01-02,unbalanced,Wages,10.00,Cash,9.00,,\n";

    import_text(text, false);
    for (const auto& line : recent_logs()) {
        EXPECT_EQ(std::string::npos, line.find("[WARN]"));
    }

    Ledger verbose_ledger("Verbose");
    std::istringstream in(text);
    read_transactions_csv(verbose_ledger, in, true);

    auto logs = recent_logs();
    ASSERT_FALSE(logs.empty());
    EXPECT_NE(std::string::npos, logs.back().find("[WARN] Skipping CSV row at line 3"));
}

TEST_F(CsvCodecTest, MissingRequiredColumn)
{
    EXPECT_THROW(import_text("id,date,description,debit_account,debit_amount,credit_account\n"
                             "1,1397-01-01,seed,Cash,100.00,Owner's Capital\n"),
                 ImportError);
    EXPECT_TRUE(t_ledger.transactions().empty());
}

TEST_F(CsvCodecTest, EmptyInput)
{
    EXPECT_EQ(0u, import_text(""));
    EXPECT_EQ(0u, import_text(kHeader));
}

TEST_F(CsvCodecTest, MissingFile)
{
    EXPECT_THROW(import_transactions_from_csv(t_ledger, testing::TempDir() + "no-such-ledger.csv"), ImportError);
}

TEST_F(CsvCodecTest, ColumnsFoundByName)
{
    // Generator output: extra columns, different order, optional pair absent.
    std::size_t posted = import_text(
        "\xEF\xBB\xBF" "date,branch,type,description,credit_amount,credit_account,debit_amount,debit_account\r\n"
        "1397-03-01,Florence,deposit,\"Deposit, Strozzi\",500.00,Deposits Payable,500.00,Cash\r\n");

    EXPECT_EQ(1u, posted);
    EXPECT_EQ(Money::parse("500.00"), balance_of("Cash"));
    EXPECT_EQ(AccountType::Liability, t_ledger.find_account("Deposits Payable")->type());
    EXPECT_EQ("Deposit, Strozzi", t_ledger.transactions()[0].description());
}

TEST_F(CsvCodecTest, DebitAmountIsSplitEqually)
{
    std::size_t posted = import_text(kHeader +
        "1,1397-04-01,running costs,\"Wages, Rent\",100.00,Cash,100.00,,\n");

    ASSERT_EQ(1u, posted);
    const Transaction& tx = t_ledger.transactions()[0];
    ASSERT_EQ(2u, tx.debits().size());
    EXPECT_EQ(Money::parse("50.00"), tx.debits()[0].amount);
    EXPECT_EQ(Money::parse("50.00"), tx.debits()[1].amount);
    EXPECT_EQ(Money::parse("50.00"), balance_of("Rent"));
    EXPECT_EQ(AccountType::Expense, t_ledger.find_account("Rent")->type());
}

TEST_F(CsvCodecTest, UnevenSplitIsSkipped)
{
    std::size_t posted = import_text(kHeader +
        "1,1397-04-01,three ways,\"Wages,Rent,Supplies\",100.00,Cash,100.00,,\n"
        "2,1397-04-02,empty name,\"Wages,,Rent\",90.00,Cash,90.00,,\n");

    EXPECT_EQ(0u, posted);
    EXPECT_TRUE(t_ledger.accounts().empty());
}

TEST_F(CsvCodecTest, SecondCreditLeg)
{
    std::size_t posted = import_text(kHeader +
        "1,1397-05-01,zero second leg,Cash,10.00,Owner's Capital,10.00,Interest Income,0.00\n"
        "2,1397-05-02,blank second leg,Cash,10.00,Owner's Capital,10.00,Interest Income,\n"
        "3,1397-05-03,second leg without account,Cash,10.00,Owner's Capital,5.00,,5.00\n"
        "4,1397-05-04,two credits,Cash,10.00,Owner's Capital,7.50,Interest Income,2.50\n");

    EXPECT_EQ(3u, posted);
    EXPECT_EQ(1u, t_ledger.transactions()[0].credits().size());
    EXPECT_EQ(1u, t_ledger.transactions()[1].credits().size());
    EXPECT_EQ(2u, t_ledger.transactions()[2].credits().size());
    EXPECT_EQ(Money::parse("30.00"), balance_of("Cash"));
    EXPECT_EQ(Money::parse("27.50"), balance_of("Owner's Capital"));
    EXPECT_EQ(Money::parse("2.50"), balance_of("Interest Income"));
}

TEST_F(CsvCodecTest, NegativeSecondCreditIsLeftOut)
{
    std::size_t posted = import_text(kHeader +
        "1,1397-05-05,refund noted,Cash,10.00,Sales,10.00,Exchange Fee,-1.00\n"
        "2,1397-05-06,bad second amount,Cash,10.00,Sales,10.00,Exchange Fee,ten\n");

    EXPECT_EQ(1u, posted);
    ASSERT_EQ(1u, t_ledger.transactions().size());
    EXPECT_EQ(1u, t_ledger.transactions()[0].credits().size());
    EXPECT_EQ(Money::parse("10.00"), balance_of("Sales"));
    EXPECT_EQ(nullptr, t_ledger.find_account("Exchange Fee"));
}

TEST_F(CsvCodecTest, OverflowingRowIsSkipped)
{
    std::size_t posted = import_text(kHeader +
        "1,1397-06-01,huge loan,Cash,90000000000000000.00,Bank Loan,90000000000000000.00,,\n"
        "2,1397-06-02,second huge loan,Cash,90000000000000000.00,Bank Loan,90000000000000000.00,,\n"
        "3,1397-06-03,huge credits,Land,1.00,Owner's Capital,90000000000000000.00,Retained Earnings,90000000000000000.00\n"
        "4,1397-06-04,small loan,Cash,5.00,Bank Loan,5.00,,\n");

    EXPECT_EQ(2u, posted);
    EXPECT_EQ(Money::parse("90000000000000005.00"), balance_of("Cash"));
    EXPECT_EQ(Money::parse("90000000000000005.00"), balance_of("Bank Loan"));
    EXPECT_EQ(nullptr, t_ledger.find_account("Land"));
    EXPECT_TRUE(t_ledger.trial_balance().is_balanced());
}

TEST_F(CsvCodecTest, Export)
{
    Account& cash = t_ledger.create_account("Cash", AccountType::Asset);
    Account& capital = t_ledger.create_account("Owner's Capital", AccountType::Equity);
    Account& interest = t_ledger.create_account("Interest Income", AccountType::Revenue);
    Account& receivable = t_ledger.create_account("Accounts Receivable", AccountType::Asset);
    t_ledger.record_transaction(Date(1397, 1, 1), "Initial investment", {{cash, "10000"}, {capital, "10000"}});
    t_ledger.record_transaction(Date(1397, 8, 10), "Repayment, with interest",
                                {{cash, "1200"}, {receivable, "-1000"}, {interest, "200"}});

    std::ostringstream out;
    EXPECT_EQ(2u, write_transactions_csv(t_ledger, out));
    EXPECT_EQ(kHeader +
              "1,1397-01-01,Initial investment,Cash,10000.00,Owner's Capital,10000.00,,\n"
              "2,1397-08-10,\"Repayment, with interest\",Cash,1200.00,Accounts Receivable,1000.00,Interest Income,200.00\n",
              out.str());
}

TEST_F(CsvCodecTest, ExportToUnwritablePath)
{
    EXPECT_THROW(export_transactions_to_csv(t_ledger, testing::TempDir() + "no-such-dir/ledger.csv"), ExportError);
}
