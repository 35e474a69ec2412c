/**
 * @file config.hpp
 * @brief Server configuration and its command line form
 */

#pragma once

#include "echo/dispatcher.hpp"
#include "echo/listener.hpp"
#include "echo/log.hpp"

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace echo {

struct server_config {
    listener_config listener;
    dispatch_mode mode = dispatch_mode::thread_per_connection;

    /// Longest a blocked accept or read waits before re-checking the running flag
    std::chrono::milliseconds poll_interval{100};

    /// Capacity of the client registry; connections beyond it are closed
    std::size_t max_clients = 100;
};

class config_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @struct command_line
 * @brief Result of parsing the echo_server arguments
 */
struct command_line {
    server_config config;
    log::level log_level = log::level::info;
    bool show_help = false;
};

/**
 * @brief Parse echo_server options with getopt_long
 * @throws config_error on unknown options or malformed values
 */
command_line parse_command_line(int argc, char* argv[]);

/**
 * @brief Check the invariants of a configuration built in code
 * @throws bind_error if the listener options are invalid (backlog <= 0)
 * @throws config_error for the remaining server options
 */
void validate(const server_config& config);

std::string usage(const std::string& program);

} // namespace echo
