/**
 * @file listener.hpp
 * @brief Listening socket construction with explicit reuse and backlog options
 */

#pragma once

#include <asio.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace echo {

/**
 * @class reuse_port
 * @brief SO_REUSEPORT as an asio socket option
 *
 * asio ships reuse_address but not reuse_port. This models asio's
 * SettableSocketOption and GettableSocketOption requirements, so it works with
 * set_option() and get_option() on any socket or acceptor.
 */
class reuse_port {
public:
    reuse_port() = default;
    explicit reuse_port(bool enabled) : value_(enabled ? 1 : 0) {}

    bool value() const { return value_ != 0; }

    template <typename Protocol>
    int level(const Protocol&) const { return SOL_SOCKET; }

    template <typename Protocol>
    int name(const Protocol&) const { return SO_REUSEPORT; }

    template <typename Protocol>
    int* data(const Protocol&) { return &value_; }

    template <typename Protocol>
    const int* data(const Protocol&) const { return &value_; }

    template <typename Protocol>
    std::size_t size(const Protocol&) const { return sizeof(value_); }

    template <typename Protocol>
    void resize(const Protocol&, std::size_t new_size) {
        if (new_size != sizeof(value_)) {
            throw std::length_error("reuse_port option resize");
        }
    }

private:
    int value_ = 0;
};

/**
 * @struct listener_config
 * @brief Options applied when the listening socket is created
 */
struct listener_config {
    std::string address = "127.0.0.1:8080"; ///< "host:port" or "[v6]:port"
    bool reuse_address = true;
    bool reuse_port = true;
    int backlog = 42;
};

/**
 * @class bind_error
 * @brief Socket construction, bind or listen failure. Fatal to startup.
 */
class bind_error : public std::system_error {
public:
    bind_error(std::error_code ec, const std::string& what)
        : std::system_error(ec, what) {}
};

/**
 * @brief Split "host:port" (or "[host]:port") into its parts
 * @throws bind_error if the string has no port or the port is not a number in 0-65535
 */
void split_address(const std::string& address, std::string& host, unsigned short& port);

/**
 * @brief Resolve a listener address to a single endpoint
 *
 * Literal addresses are used as is; names are resolved and the first result
 * wins.
 */
asio::ip::tcp::endpoint resolve_listen_endpoint(asio::io_context& io_context,
                                                const std::string& address);

/**
 * @brief Build a bound, listening acceptor
 *
 * Reuse options are applied before bind and the backlog at listen time.
 *
 * @throws bind_error on any failure; there is no retry
 */
asio::ip::tcp::acceptor make_listener(asio::io_context& io_context,
                                      const listener_config& config);

} // namespace echo
