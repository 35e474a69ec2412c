/**
 * @file log.hpp
 * @brief Console logging for the echo server
 *
 * Lines go to std::cout (debug, info) or std::cerr (warn, error), prefixed
 * with a timestamp and the level. Writes are serialized so output from
 * handler threads does not interleave.
 */

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace echo::log {

enum class level { debug, info, warn, error, off };

void set_level(level threshold);
level get_level();

std::string_view to_string(level lvl);
std::optional<level> parse_level(std::string_view name);

void write(level lvl, const std::string& message);

template <typename... Args>
void emit(level lvl, const Args&... args) {
    if (lvl < get_level()) return;
    std::ostringstream out;
    (out << ... << args);
    write(lvl, out.str());
}

template <typename... Args>
void debug(const Args&... args) { emit(level::debug, args...); }

template <typename... Args>
void info(const Args&... args) { emit(level::info, args...); }

template <typename... Args>
void warn(const Args&... args) { emit(level::warn, args...); }

template <typename... Args>
void error(const Args&... args) { emit(level::error, args...); }

} // namespace echo::log
