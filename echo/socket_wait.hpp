/**
 * @file socket_wait.hpp
 * @brief Bounded readiness wait on a synchronous asio socket or acceptor
 *
 * asio's blocking read_some, write and accept cannot time out, so the server
 * polls the native handle first and only calls into asio once data, buffer
 * space or a pending connection is there.
 */

#pragma once

#include <poll.h>

#include <cerrno>
#include <chrono>
#include <system_error>

namespace echo {

enum class wait_result { ready, timed_out, failed };

template <typename Socket>
wait_result wait_for(Socket& socket, short events, std::chrono::milliseconds timeout,
                     std::error_code& ec) {
    ec.clear();
    if (!socket.is_open()) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return wait_result::failed;
    }

    pollfd descriptor{};
    descriptor.fd = socket.native_handle();
    descriptor.events = events;

    while (true) {
        int rc = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
        if (rc > 0) {
            if (descriptor.revents & POLLNVAL) {
                ec = std::make_error_code(std::errc::bad_file_descriptor);
                return wait_result::failed;
            }
            // POLLHUP and POLLERR are reported as ready; the following read,
            // write or accept surfaces the actual condition.
            return wait_result::ready;
        }
        if (rc == 0) {
            return wait_result::timed_out;
        }
        if (errno == EINTR) {
            continue;
        }
        ec = std::error_code(errno, std::system_category());
        return wait_result::failed;
    }
}

template <typename Socket>
wait_result wait_readable(Socket& socket, std::chrono::milliseconds timeout,
                          std::error_code& ec) {
    return wait_for(socket, POLLIN, timeout, ec);
}

template <typename Socket>
wait_result wait_writable(Socket& socket, std::chrono::milliseconds timeout,
                          std::error_code& ec) {
    return wait_for(socket, POLLOUT, timeout, ec);
}

} // namespace echo
