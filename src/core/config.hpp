/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Runtime settings. Defaults are overridden by a JSON settings file, then
 * by environment variables:
 *
 *   {
 *     "ledger": { "name": "Medici Family Bank" },
 *     "import": { "verbose": true },
 *     "log":    { "level": "DEBUG", "echo": true, "capacity": 500 }
 *   }
 *
 *   DUCAT_CONFIG       path of the settings file (when none is passed in)
 *   DUCAT_LEDGER_NAME  overrides ledger.name
 *   DUCAT_LOG_LEVEL    overrides log.level
 * ============================================================================
 */

#ifndef DUCAT_CONFIG_HPP
#define DUCAT_CONFIG_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ducat {

    struct Config {
        std::string ledger_name = "General Ledger";
        bool verbose_import = false;
        std::string log_level = "INFO";
        bool log_echo = true;
        std::size_t log_capacity = 200;
    };

    /**
     * @brief Overlays the recognised keys of a settings document onto config.
     * Keys that are absent keep their current value.
     */
    void apply_settings(Config& config, const json& settings);

    /**
     * @brief Builds the effective configuration.
     * A missing or unparseable settings file is logged and the defaults are
     * kept; configuration problems never stop the engine.
     * @param path Settings file; when empty, DUCAT_CONFIG is consulted.
     */
    Config load_config(const std::string& path = "");

    // Pushes the logging settings into the process-wide logger.
    void apply_logging(const Config& config);

} // namespace ducat

#endif // DUCAT_CONFIG_HPP
