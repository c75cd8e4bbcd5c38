/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: log.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Process-wide logger. Every line is timestamped, kept in a bounded in-memory
 * buffer and echoed to standard output.
 *
 *   [14:03:27] [WARN] Skipping CSV row 4: ...
 *
 * Levels, lowest first: DEBUG, INFO, WARN, ERROR, FATAL.
 * ============================================================================
 */

#ifndef DUCAT_LOG_HPP
#define DUCAT_LOG_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace ducat {

    void ducat_log(const std::string& level, const std::string& message);

    // Messages below this level are dropped. Unknown names fall back to INFO.
    void set_log_level(const std::string& level);
    void set_log_echo(bool echo);
    void set_log_capacity(std::size_t capacity);

    // Snapshot of the buffered lines, oldest first.
    std::vector<std::string> recent_logs();
    void clear_logs();

} // namespace ducat

#endif // DUCAT_LOG_HPP
