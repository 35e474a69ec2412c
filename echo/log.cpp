#include "echo/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace echo::log {

namespace {

std::atomic<level> threshold_{level::info};
std::mutex output_mutex_;

} // namespace

void set_level(level threshold) {
    threshold_.store(threshold);
}

level get_level() {
    return threshold_.load();
}

std::string_view to_string(level lvl) {
    switch (lvl) {
    case level::debug: return "DEBUG";
    case level::info: return "INFO";
    case level::warn: return "WARN";
    case level::error: return "ERROR";
    case level::off: return "OFF";
    }
    return "UNKNOWN";
}

std::optional<level> parse_level(std::string_view name) {
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "warn" || name == "warning") return level::warn;
    if (name == "error") return level::error;
    if (name == "off" || name == "none") return level::off;
    return std::nullopt;
}

void write(level lvl, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream line;
    line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "."
         << std::setfill('0') << std::setw(3) << millis.count() << "] "
         << "[" << to_string(lvl) << "] " << message;

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (lvl >= level::warn) {
        std::cerr << line.str() << std::endl;
    } else {
        std::cout << line.str() << std::endl;
    }
}

} // namespace echo::log
