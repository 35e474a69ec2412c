/**
 * @file server.hpp
 * @brief TCP echo server: accept loop, dispatch and graceful shutdown
 *
 * The server binds in its constructor, so a server object that exists is
 * listening until stop(). Connections are served either inline on the accept
 * thread or one thread per connection, depending on server_config::mode.
 */

#pragma once

#include "echo/config.hpp"
#include "echo/dispatcher.hpp"
#include "echo/server_state.hpp"

#include <asio.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace echo {

class server {
public:
    /**
     * @brief Bind and start accepting on a background thread
     * @throws bind_error if the listener cannot be created
     * @throws config_error if a server option is invalid
     */
    static std::unique_ptr<server> start(const server_config& config);

    /**
     * @brief Bind the listener without starting the accept loop
     * @throws bind_error, config_error
     */
    explicit server(const server_config& config);

    /**
     * @brief Shuts down like stop(), without the warning when already stopped
     */
    ~server();

    server(const server&) = delete;
    server& operator=(const server&) = delete;

    /**
     * @brief Accept loop on the calling thread
     *
     * Returns once stop() has been requested or the listener became invalid,
     * after every connection handler has finished and the listener is closed.
     * Does nothing if the server was already stopped.
     */
    void run();

    /**
     * @brief Request shutdown and wait for it to complete
     *
     * Clears the running flag, waits for the accept loop to close the
     * listener, and waits for in-flight handlers to finish on their own.
     * Calling it again has no further effect.
     */
    void stop();

    bool is_running() const { return state_.running.is_set(); }
    bool is_listening() const;

    asio::ip::tcp::endpoint local_endpoint() const { return local_endpoint_; }

    /**
     * @brief Native descriptor of the listening socket
     *
     * Fixed at construction; only meaningful while is_listening().
     */
    asio::ip::tcp::acceptor::native_handle_type listener_handle() const { return listener_handle_; }

    std::size_t connection_count() const { return state_.clients.size(); }
    std::size_t active_handlers() const { return dispatcher_->active(); }

    const server_config& config() const { return config_; }

private:
    server_config config_;
    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    asio::ip::tcp::acceptor::native_handle_type listener_handle_;
    asio::ip::tcp::endpoint local_endpoint_;
    server_state state_;
    std::unique_ptr<dispatcher> dispatcher_;

    std::thread accept_thread_;
    std::mutex stop_mutex_;

    // Guards loop_active_ and listening_
    mutable std::mutex lifecycle_mutex_;
    std::condition_variable loop_finished_;
    bool loop_active_ = false;
    bool listening_ = true;

    void accept_loop();
    void serve(asio::ip::tcp::socket socket);
    void wait_for_shutdown();
    void close_listener();
};

} // namespace echo
