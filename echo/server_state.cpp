#include "echo/server_state.hpp"

namespace echo {

std::optional<client_registry::client_id> client_registry::add(
    const asio::ip::tcp::endpoint& remote) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (clients_.size() >= capacity_) {
        return std::nullopt;
    }

    client_id id = next_id_++;
    clients_.emplace(id, entry{id, remote, std::chrono::steady_clock::now()});
    return id;
}

bool client_registry::remove(client_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.erase(id) > 0;
}

std::size_t client_registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

std::vector<client_registry::entry> client_registry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<entry> result;
    result.reserve(clients_.size());
    for (const auto& [id, client] : clients_) {
        result.push_back(client);
    }
    return result;
}

} // namespace echo
