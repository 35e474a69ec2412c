#include "echo/echo_client.hpp"

#include "echo/connection_handler.hpp"
#include "echo/socket_wait.hpp"

#include <array>
#include <system_error>

namespace echo {

echo_client::echo_client(std::chrono::milliseconds receive_timeout)
    : io_context_()
    , socket_(io_context_)
    , receive_timeout_(receive_timeout)
{
}

void echo_client::connect(const std::string& host, const std::string& service) {
    asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, service);
    asio::connect(socket_, endpoints);
    configure_socket();
}

void echo_client::connect(const asio::ip::tcp::endpoint& endpoint) {
    socket_.connect(endpoint);
    configure_socket();
}

void echo_client::send(const std::string& data) {
    asio::write(socket_, asio::buffer(data));
}

std::string echo_client::receive_some() {
    std::error_code ec;
    auto ready = wait_readable(socket_, receive_timeout_, ec);
    if (ready == wait_result::timed_out) {
        throw std::system_error(std::make_error_code(std::errc::timed_out), "receive");
    }
    if (ready == wait_result::failed) {
        throw std::system_error(ec, "receive");
    }

    std::array<char, max_chunk_size> buffer;
    std::size_t length = socket_.read_some(asio::buffer(buffer), ec);
    if (ec == asio::error::eof) {
        return std::string();
    }
    if (ec) {
        throw std::system_error(ec, "receive");
    }
    return std::string(buffer.data(), length);
}

std::string echo_client::receive_exactly(std::size_t count) {
    std::string received;
    while (received.size() < count) {
        auto chunk = receive_some();
        if (chunk.empty()) {
            throw std::system_error(asio::error::eof, "connection closed after " +
                                    std::to_string(received.size()) + " of " +
                                    std::to_string(count) + " bytes");
        }
        received += chunk;
    }
    return received;
}

std::string echo_client::exchange(const std::string& message) {
    send(message);
    return receive_exactly(message.size());
}

void echo_client::shutdown_send() {
    socket_.shutdown(asio::ip::tcp::socket::shutdown_send);
}

void echo_client::abort() {
    std::error_code ec;
    socket_.set_option(asio::socket_base::linger(true, 0), ec);
    socket_.close(ec);
}

void echo_client::close() {
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void echo_client::configure_socket() {
    // Small messages should leave immediately
    socket_.set_option(asio::ip::tcp::no_delay(true));
}

} // namespace echo
