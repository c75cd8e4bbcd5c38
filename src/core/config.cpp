/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "log.hpp"

#include <cstdlib>
#include <fstream>

namespace ducat {

void apply_settings(Config& config, const json& settings) {
    if (!settings.is_object()) {
        ducat_log("WARN", "Settings document is not an object. Using system defaults.");
        return;
    }

    if (settings.contains("ledger") && settings["ledger"].is_object()) {
        const json& ledger_settings = settings["ledger"];
        config.ledger_name = ledger_settings.value("name", config.ledger_name);
    }

    if (settings.contains("import") && settings["import"].is_object()) {
        const json& import_settings = settings["import"];
        config.verbose_import = import_settings.value("verbose", config.verbose_import);
    }

    if (settings.contains("log") && settings["log"].is_object()) {
        const json& log_settings = settings["log"];
        config.log_level = log_settings.value("level", config.log_level);
        config.log_echo = log_settings.value("echo", config.log_echo);
        config.log_capacity = log_settings.value("capacity", config.log_capacity);
    }
}

Config load_config(const std::string& path) {
    Config config;

    std::string settings_path = path;
    if (settings_path.empty()) {
        const char* env_config = std::getenv("DUCAT_CONFIG");
        settings_path = env_config ? env_config : "";
    }

    if (!settings_path.empty()) {
        std::ifstream ifs(settings_path);
        if (ifs.is_open()) {
            try {
                json settings = json::parse(ifs);
                apply_settings(config, settings);
            } catch (const json::exception& e) {
                ducat_log("ERROR", "Config Parse Error: " + std::string(e.what()));
                config = Config();
            }
        } else {
            ducat_log("WARN", "Config file '" + settings_path + "' missing. Using system defaults.");
        }
    }

    const char* env_name = std::getenv("DUCAT_LEDGER_NAME");
    if (env_name && *env_name) {
        config.ledger_name = env_name;
    }

    const char* env_level = std::getenv("DUCAT_LOG_LEVEL");
    if (env_level && *env_level) {
        config.log_level = env_level;
    }

    return config;
}

void apply_logging(const Config& config) {
    set_log_level(config.log_level);
    set_log_echo(config.log_echo);
    set_log_capacity(config.log_capacity);
}

} // namespace ducat
