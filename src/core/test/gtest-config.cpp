/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: gtest-config.cpp
 * ============================================================================
 */

#include "../config.hpp"
#include "../log.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <gtest/gtest.h>

using namespace ducat;

class ConfigTest : public testing::Test
{
protected:
    void SetUp() override
    {
        set_log_echo(false);
        unsetenv("DUCAT_CONFIG");
        unsetenv("DUCAT_LEDGER_NAME");
        unsetenv("DUCAT_LOG_LEVEL");
        t_path = testing::TempDir() + "ducat-config-test.json";
    }

    void TearDown() override
    {
        std::remove(t_path.c_str());
        unsetenv("DUCAT_CONFIG");
        unsetenv("DUCAT_LEDGER_NAME");
        unsetenv("DUCAT_LOG_LEVEL");
        set_log_level("INFO");
        set_log_echo(true);
    }

    void write_settings(const std::string& text)
    {
        std::ofstream out(t_path);
        out << text;
    }

    std::string t_path;
};

TEST_F(ConfigTest, Defaults)
{
    Config config = load_config();
    EXPECT_EQ("General Ledger", config.ledger_name);
    EXPECT_FALSE(config.verbose_import);
    EXPECT_EQ("INFO", config.log_level);
    EXPECT_TRUE(config.log_echo);
    EXPECT_EQ(200u, config.log_capacity);
}

TEST_F(ConfigTest, SettingsFile)
{
    write_settings(R"({
        "ledger": {"name": "Medici Family Bank"},
        "import": {"verbose": true},
        "log": {"level": "DEBUG", "echo": false, "capacity": 50}
    })");

    Config config = load_config(t_path);
    EXPECT_EQ("Medici Family Bank", config.ledger_name);
    EXPECT_TRUE(config.verbose_import);
    EXPECT_EQ("DEBUG", config.log_level);
    EXPECT_FALSE(config.log_echo);
    EXPECT_EQ(50u, config.log_capacity);
}

TEST_F(ConfigTest, PartialSettingsKeepDefaults)
{
    Config config;
    apply_settings(config, json::parse(R"({"import": {"verbose": true}})"));
    EXPECT_TRUE(config.verbose_import);
    EXPECT_EQ("General Ledger", config.ledger_name);
    EXPECT_EQ("INFO", config.log_level);
}

TEST_F(ConfigTest, PathFromEnvironment)
{
    write_settings(R"({"ledger": {"name": "From File"}})");
    setenv("DUCAT_CONFIG", t_path.c_str(), 1);

    EXPECT_EQ("From File", load_config().ledger_name);
}

TEST_F(ConfigTest, EnvironmentOverridesFile)
{
    write_settings(R"({"ledger": {"name": "From File"}, "log": {"level": "WARN"}})");
    setenv("DUCAT_LEDGER_NAME", "From Env", 1);
    setenv("DUCAT_LOG_LEVEL", "ERROR", 1);

    Config config = load_config(t_path);
    EXPECT_EQ("From Env", config.ledger_name);
    EXPECT_EQ("ERROR", config.log_level);
}

TEST_F(ConfigTest, BrokenFileFallsBackToDefaults)
{
    write_settings(R"({"ledger": {"name": "Half written")");
    clear_logs();

    Config config = load_config(t_path);
    EXPECT_EQ("General Ledger", config.ledger_name);

    auto logs = recent_logs();
    ASSERT_FALSE(logs.empty());
    EXPECT_NE(std::string::npos, logs.back().find("Config Parse Error"));
}

TEST_F(ConfigTest, WrongValueTypeFallsBackToDefaults)
{
    write_settings(R"({"ledger": {"name": "Typed"}, "import": {"verbose": "yes"}})");

    Config config = load_config(t_path);
    EXPECT_EQ("General Ledger", config.ledger_name);
    EXPECT_FALSE(config.verbose_import);
}

TEST_F(ConfigTest, MissingFileFallsBackToDefaults)
{
    Config config = load_config(testing::TempDir() + "no-such-ducat-config.json");
    EXPECT_EQ("General Ledger", config.ledger_name);
}
