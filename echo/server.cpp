#include "echo/server.hpp"

#include "echo/connection_handler.hpp"
#include "echo/listener.hpp"
#include "echo/log.hpp"
#include "echo/socket_wait.hpp"

#include <exception>
#include <thread>

namespace echo {

namespace {

const server_config& validated(const server_config& config) {
    validate(config);
    return config;
}

/// Errors meaning the listening socket itself is gone
bool is_listener_invalid(const std::error_code& ec) {
    return ec == asio::error::bad_descriptor
        || ec == asio::error::not_socket
        || ec == asio::error::invalid_argument;
}

/// Out of descriptors or kernel memory: the pending connection stays queued
bool is_resource_exhausted(const std::error_code& ec) {
    return ec == asio::error::no_descriptors
        || ec == std::errc::too_many_files_open_in_system
        || ec == asio::error::no_buffer_space
        || ec == asio::error::no_memory;
}

} // namespace

std::unique_ptr<server> server::start(const server_config& config) {
    auto instance = std::make_unique<server>(config);
    server* raw = instance.get();
    instance->accept_thread_ = std::thread([raw]() { raw->run(); });
    return instance;
}

server::server(const server_config& config)
    : config_(validated(config))
    , io_context_()
    , acceptor_(make_listener(io_context_, config_.listener))
    , listener_handle_(acceptor_.native_handle())
    , local_endpoint_(acceptor_.local_endpoint())
    , state_(config_.max_clients)
    , dispatcher_(make_dispatcher(config_.mode))
{
    // Readiness is polled before each accept; a connection that vanishes
    // between poll and accept must not block the loop.
    std::error_code ec;
    acceptor_.non_blocking(true, ec);
    if (ec) {
        throw bind_error(ec, "set listener non-blocking");
    }
}

server::~server() {
    state_.running.clear();
    wait_for_shutdown();
}

void server::run() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (loop_active_) {
            log::warn("Accept loop is already running");
            return;
        }
        if (!state_.running.is_set()) {
            return;
        }
        loop_active_ = true;
    }

    log::info("Server is running on ", local_endpoint_, " (", to_string(config_.mode),
              "-threaded, backlog ", config_.listener.backlog, ")");

    accept_loop();

    dispatcher_->join_all();
    close_listener();
    log::info("Server stopped.");

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        loop_active_ = false;
    }
    loop_finished_.notify_all();
}

void server::stop() {
    if (state_.running.clear()) {
        log::info("Shutdown signal sent.");
    } else {
        log::warn("Server was already stopped or not running.");
    }
    wait_for_shutdown();
}

bool server::is_listening() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return listening_;
}

void server::accept_loop() {
    bool exhausted = false;

    while (state_.running.is_set()) {
        std::error_code ec;
        auto ready = wait_readable(acceptor_, config_.poll_interval, ec);
        if (ready == wait_result::timed_out) {
            continue;
        }
        if (ready == wait_result::failed) {
            log::error("Listener wait failed: ", ec.message());
            break;
        }

        asio::ip::tcp::socket socket(io_context_);
        acceptor_.accept(socket, ec);
        if (ec == asio::error::would_block || ec == asio::error::try_again) {
            continue;
        } else if (ec && is_listener_invalid(ec)) {
            log::error("Listener is no longer usable: ", ec.message());
            break;
        } else if (ec && is_resource_exhausted(ec)) {
            // The listener stays readable until a descriptor frees up
            if (!exhausted) {
                log::warn("Cannot accept connections: ", ec.message(), "; retrying every ",
                          config_.poll_interval.count(), " ms");
                exhausted = true;
            }
            std::this_thread::sleep_for(config_.poll_interval);
            continue;
        } else if (ec) {
            log::warn("Error accepting connection: ", ec.message());
            continue;
        }

        if (exhausted) {
            log::info("Accepting connections again");
            exhausted = false;
        }
        serve(std::move(socket));
    }

    // A dead listener ends the server, so handlers are told to wind down too
    if (state_.running.clear()) {
        log::warn("Accept loop ended without a stop request; shutting down");
    }
}

void server::serve(asio::ip::tcp::socket socket) {
    std::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    if (ec) {
        log::warn("Accepted connection is already gone: ", ec.message());
        return;
    }

    auto id = state_.clients.add(remote);
    if (!id) {
        log::warn("Client limit of ", state_.clients.capacity(), " reached, refusing ", remote);
        socket.close(ec);
        return;
    }

    log::info("New client connected: ", remote);

    auto handler = std::make_shared<connection_handler>(
        std::move(socket), state_.running, config_.poll_interval);
    auto client_id = *id;

    try {
        dispatcher_->dispatch([this, handler, remote, client_id]() {
            auto result = handler->run();
            state_.clients.remove(client_id);
            if (result.reason == close_reason::io_error) {
                log::warn("Client ", remote, " dropped after ", result.cycles, " echoes");
            } else {
                log::info("Client ", remote, " disconnected (", to_string(result.reason),
                          ") after ", result.cycles, " echoes, ", result.bytes_echoed, " bytes");
            }
        });
    } catch (const std::system_error& e) {
        // Thread creation failed; the handler and its socket go away here
        state_.clients.remove(client_id);
        log::error("Could not dispatch client ", remote, ": ", e.what());
    }
}

void server::wait_for_shutdown() {
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);

    {
        std::unique_lock<std::mutex> lock(lifecycle_mutex_);
        loop_finished_.wait(lock, [this]() { return !loop_active_; });
    }

    if (accept_thread_.joinable() && accept_thread_.get_id() != std::this_thread::get_id()) {
        accept_thread_.join();
    }

    // Covers a server whose accept loop never ran
    dispatcher_->join_all();
    close_listener();
}

void server::close_listener() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!listening_) {
        return;
    }

    std::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        log::error("Error closing acceptor: ", ec.message());
    }
    listening_ = false;
}

} // namespace echo
