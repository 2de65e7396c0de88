/**
 * ============================================================================
 * SOFTWARE: OSL: Sovereign Accounting Suite - Debt Sync Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logging.cpp
 * ============================================================================
 */

#include "logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace dsync {

namespace {

std::deque<std::string> system_logs;
std::mutex log_mutex;
std::atomic<bool> echo_enabled{true};

} // namespace

void dsync_log(const std::string& level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    if (system_logs.size() >= kLogCapacity) {
        system_logs.pop_front();
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%H:%M:%S");

    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;
    system_logs.push_back(log_entry);

    if (echo_enabled.load()) {
        std::cout << log_entry << std::endl;
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

void set_log_echo(bool enabled) {
    echo_enabled.store(enabled);
}

} // namespace dsync
