/**
 * @file echo_client_main.cpp
 * @brief Sends each argument to an echo server and prints what comes back
 *
 * Usage: echo_client HOST PORT MESSAGE...
 */

#include "echo/echo_client.hpp"

#include <iostream>
#include <system_error>

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " HOST PORT MESSAGE...\n";
        return 2;
    }

    try {
        echo::echo_client client;
        client.connect(argv[1], argv[2]);
        std::cout << "Connected to " << argv[1] << ":" << argv[2] << std::endl;

        for (int i = 3; i < argc; ++i) {
            auto reply = client.exchange(argv[i]);
            std::cout << "Server response: " << reply << std::endl;
        }

        client.shutdown_send();
        if (!client.receive_some().empty()) {
            std::cerr << "Unexpected data after half-close" << std::endl;
            return 1;
        }
        client.close();

    } catch (const std::system_error& e) {
        std::cerr << "Communication error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
