/**
 * @file echo_client.hpp
 * @brief Synchronous client for talking to the echo server
 */

#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace echo {

/**
 * @class echo_client
 * @brief Blocking TCP client with a receive timeout
 *
 * Demonstrates:
 * - Name resolution with basic_resolver
 * - Half-close via shutdown_send
 * - Reading an echo that arrives in several chunks
 *
 * Errors are thrown as std::system_error.
 */
class echo_client {
public:
    explicit echo_client(std::chrono::milliseconds receive_timeout = std::chrono::seconds(5));

    /**
     * @brief Resolve host/service and connect to the first endpoint that accepts
     */
    void connect(const std::string& host, const std::string& service);
    void connect(const asio::ip::tcp::endpoint& endpoint);

    void send(const std::string& data);

    /**
     * @brief Read whatever is available, waiting up to the receive timeout
     * @return The bytes read; empty once the server closed the connection
     * @throws std::system_error on timeout or read failure
     */
    std::string receive_some();

    /**
     * @brief Read until exactly count bytes arrived
     * @throws std::system_error on timeout, early EOF or read failure
     */
    std::string receive_exactly(std::size_t count);

    /**
     * @brief Send a message and read back as many bytes as were sent
     */
    std::string exchange(const std::string& message);

    /**
     * @brief Close the write side so the server sees EOF
     */
    void shutdown_send();

    /**
     * @brief Close with SO_LINGER 0, so the server sees a reset
     */
    void abort();

    void close();

    void set_receive_timeout(std::chrono::milliseconds timeout) {
        receive_timeout_ = timeout;
    }

    bool is_connected() const {
        return socket_.is_open();
    }

    asio::ip::tcp::socket& socket() { return socket_; }

private:
    asio::io_context io_context_;
    asio::ip::tcp::socket socket_;
    std::chrono::milliseconds receive_timeout_;

    void configure_socket();
};

} // namespace echo
