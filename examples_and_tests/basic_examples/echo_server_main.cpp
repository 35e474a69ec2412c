/**
 * @file echo_server_main.cpp
 * @brief Command line entry point for the echo server
 *
 * Runs until SIGINT or SIGTERM, then shuts down gracefully. The accept loop
 * runs on the main thread, so the process also ends if the listener fails.
 */

#include "echo/config.hpp"
#include "echo/listener.hpp"
#include "echo/log.hpp"
#include "echo/server.hpp"

#include <asio.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

int main(int argc, char* argv[]) {
    echo::command_line options;
    try {
        options = echo::parse_command_line(argc, argv);
    } catch (const echo::config_error& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n\n" << echo::usage(argv[0]);
        return 2;
    }

    if (options.show_help) {
        std::cout << echo::usage(argv[0]);
        return 0;
    }

    echo::log::set_level(options.log_level);

    try {
        echo::server server(options.config);
        std::atomic<bool> signalled{false};

        asio::io_context signal_context;
        asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([&server, &signalled](const std::error_code& error, int signal_number) {
            if (error) {
                return;
            }
            echo::log::info("Received signal ", signal_number, ", shutting down...");
            signalled = true;
            server.stop();
        });
        std::thread signal_thread([&signal_context]() { signal_context.run(); });

        server.run();

        signal_context.stop();
        signal_thread.join();

        if (!signalled) {
            echo::log::error("Server stopped without a shutdown request");
            return 1;
        }

    } catch (const echo::bind_error& e) {
        echo::log::error("Failed to start server: ", e.what());
        return 1;
    } catch (const std::system_error& e) {
        echo::log::error("Server error: ", e.what());
        return 1;
    }

    return 0;
}
