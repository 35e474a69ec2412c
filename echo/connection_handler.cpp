#include "echo/connection_handler.hpp"

#include "echo/log.hpp"
#include "echo/socket_wait.hpp"

namespace echo {

std::string_view to_string(close_reason reason) {
    switch (reason) {
    case close_reason::peer_closed: return "peer closed";
    case close_reason::io_error: return "i/o error";
    case close_reason::shutdown: return "shutdown";
    }
    return "unknown";
}

connection_handler::connection_handler(asio::ip::tcp::socket socket,
                                       const running_flag& running,
                                       std::chrono::milliseconds poll_interval)
    : socket_(std::move(socket))
    , running_(running)
    , poll_interval_(poll_interval)
{
}

handler_result connection_handler::run() {
    handler_result result;

    // Reads and writes both wait in poll_interval steps, so a peer that stops
    // reading cannot hold the handler past shutdown.
    std::error_code ec;
    socket_.non_blocking(true, ec);
    if (ec) {
        log::error("Could not make connection non-blocking: ", ec.message());
        result.reason = close_reason::io_error;
        close();
        return result;
    }

    while (true) {
        if (!running_.is_set()) {
            result.reason = close_reason::shutdown;
            break;
        }

        std::error_code error;
        auto ready = wait_readable(socket_, poll_interval_, error);
        if (ready == wait_result::timed_out) {
            continue;
        }
        if (ready == wait_result::failed) {
            log::error("Wait error: ", error.message());
            result.reason = close_reason::io_error;
            break;
        }

        std::size_t bytes_received = socket_.read_some(asio::buffer(buffer_), error);
        if (error == asio::error::would_block || error == asio::error::try_again) {
            continue;
        } else if (error == asio::error::eof) {
            result.reason = close_reason::peer_closed;
            break;
        } else if (error) {
            log::error("Read error: ", error.message());
            result.reason = close_reason::io_error;
            break;
        }

        // Echo exactly the bytes just read
        if (!write_back(bytes_received, result.reason)) {
            break;
        }

        ++result.cycles;
        result.bytes_echoed += bytes_received;
        log::debug("Echoed ", bytes_received, " bytes");
    }

    close();
    return result;
}

bool connection_handler::write_back(std::size_t size, close_reason& reason) {
    std::size_t written = 0;
    while (written < size) {
        std::error_code error;
        written += socket_.write_some(asio::buffer(buffer_.data() + written, size - written), error);
        if (!error) {
            continue;
        }
        if (error != asio::error::would_block && error != asio::error::try_again) {
            log::error("Write error: ", error.message());
            reason = close_reason::io_error;
            return false;
        }

        // The peer's receive window is full
        while (true) {
            if (!running_.is_set()) {
                reason = close_reason::shutdown;
                return false;
            }
            auto ready = wait_writable(socket_, poll_interval_, error);
            if (ready == wait_result::ready) {
                break;
            }
            if (ready == wait_result::failed) {
                log::error("Wait error: ", error.message());
                reason = close_reason::io_error;
                return false;
            }
        }
    }
    return true;
}

void connection_handler::close() {
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

} // namespace echo
