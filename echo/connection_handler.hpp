/**
 * @file connection_handler.hpp
 * @brief Read-echo-write loop for one accepted connection
 */

#pragma once

#include "echo/server_state.hpp"

#include <asio.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <string_view>

namespace echo {

/// Upper bound on a single read, and therefore on a single echoed chunk
inline constexpr std::size_t max_chunk_size = 1024;

enum class close_reason {
    peer_closed, ///< EOF from the peer
    io_error,    ///< read or write failed, including resets
    shutdown     ///< running flag observed cleared
};

std::string_view to_string(close_reason reason);

struct handler_result {
    close_reason reason = close_reason::peer_closed;
    std::size_t cycles = 0;       ///< completed read-echo-write cycles
    std::size_t bytes_echoed = 0;
};

/**
 * @class connection_handler
 * @brief Owns one connected socket and echoes everything it reads
 *
 * The handler is the only user of its socket; it is moved in and closed when
 * run() returns. I/O errors end this connection only and are logged, never
 * thrown.
 */
class connection_handler {
public:
    connection_handler(asio::ip::tcp::socket socket,
                       const running_flag& running,
                       std::chrono::milliseconds poll_interval);

    connection_handler(const connection_handler&) = delete;
    connection_handler& operator=(const connection_handler&) = delete;

    /**
     * @brief Serve the connection until the peer closes, an I/O error occurs
     *        or shutdown is requested
     *
     * The running flag is checked before every read, and reads wait at most
     * poll_interval for data before checking again. A write stalled by a
     * peer that does not read is bounded the same way.
     */
    handler_result run();

private:
    asio::ip::tcp::socket socket_;
    const running_flag& running_;
    std::chrono::milliseconds poll_interval_;
    std::array<char, max_chunk_size> buffer_;

    /// Writes buffer_[0, size); false with reason set if the connection ends
    bool write_back(std::size_t size, close_reason& reason);
    void close();
};

} // namespace echo
