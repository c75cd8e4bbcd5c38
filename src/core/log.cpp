/**
 * ============================================================================
 * SOFTWARE: Ducat: Double-Entry Ledger Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: log.cpp
 * ============================================================================
 */

#include "log.hpp"

#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ducat {

namespace {

std::deque<std::string> system_logs;
std::mutex log_mutex;
std::size_t log_capacity = 200;
int min_rank = 1;
bool log_echo = true;

int level_rank(const std::string& level) {
    if (level == "DEBUG") return 0;
    if (level == "INFO") return 1;
    if (level == "WARN") return 2;
    if (level == "ERROR") return 3;
    if (level == "FATAL") return 4;
    return -1;
}

} // namespace

void ducat_log(const std::string& level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    int rank = level_rank(level);
    if (rank >= 0 && rank < min_rank) {
        return;
    }

    while (log_capacity > 0 && system_logs.size() >= log_capacity) {
        system_logs.pop_front();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%H:%M:%S");

    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;
    if (log_capacity > 0) {
        system_logs.push_back(log_entry);
    }

    if (log_echo) {
        std::cout << log_entry << std::endl;
    }
}

void set_log_level(const std::string& level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    int rank = level_rank(level);
    min_rank = rank >= 0 ? rank : 1;
}

void set_log_echo(bool echo) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_echo = echo;
}

void set_log_capacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_capacity = capacity;
    while (system_logs.size() > log_capacity) {
        system_logs.pop_front();
    }
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

void clear_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    system_logs.clear();
}

} // namespace ducat
