/**
 * @file server_state.hpp
 * @brief State shared by the accept loop and every connection handler
 */

#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace echo {

/**
 * @class running_flag
 * @brief One-way "keep serving" flag
 *
 * Starts set. clear() is the only mutator, so once cleared the flag stays
 * cleared.
 */
class running_flag {
public:
    bool is_set() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /**
     * @brief Clear the flag
     * @return true if this call cleared it, false if it was already clear
     */
    bool clear() noexcept {
        return running_.exchange(false, std::memory_order_acq_rel);
    }

private:
    std::atomic<bool> running_{true};
};

/**
 * @class client_registry
 * @brief Bounded set of live connections
 *
 * The lock is held only while the map is touched, never around socket I/O.
 */
class client_registry {
public:
    using client_id = std::uint64_t;

    struct entry {
        client_id id;
        asio::ip::tcp::endpoint remote;
        std::chrono::steady_clock::time_point connected_at;
    };

    explicit client_registry(std::size_t capacity) : capacity_(capacity) {}

    /**
     * @brief Register a new client
     * @return The client id, or nullopt when the registry is full
     */
    std::optional<client_id> add(const asio::ip::tcp::endpoint& remote);

    /**
     * @brief Forget a client
     * @return false if the id was unknown
     */
    bool remove(client_id id);

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }
    std::vector<entry> snapshot() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::map<client_id, entry> clients_;
    client_id next_id_ = 1;
};

/**
 * @struct server_state
 * @brief Everything shared across the server's threads
 */
struct server_state {
    explicit server_state(std::size_t max_clients) : clients(max_clients) {}

    running_flag running;
    client_registry clients;
};

} // namespace echo
